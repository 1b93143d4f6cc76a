#include "mailjmap/maintenance.hpp"
#include "mailjmap/mail_store_transaction.hpp"

#include "spdlog/spdlog.h"

Maintenance::Maintenance(MailStore * store, BlobStore * blobs, ServerConfig * config, EmailEngine * emails) :
    store(store), blobs(blobs), config(config), emails(emails)
{
}

MaintenanceReport Maintenance::run(time_t now) {
    time_t cutoff = now - config->orphanBlobGraceSeconds;
    MaintenanceReport report;
    report.orphanMessages = collectOrphanMessages(cutoff);
    report.orphanBlobs = sweepOrphanBlobs(cutoff);
    if (report.orphanMessages || report.orphanBlobs) {
        spdlog::get("logger")->info("Maintenance removed {} orphan messages and {} orphan blobs", report.orphanMessages, report.orphanBlobs);
    }
    return report;
}

int Maintenance::collectOrphanMessages(time_t cutoff) {
    std::vector<std::string> ids;
    {
        SQLite::Statement query(store->db(), "SELECT id FROM Message WHERE createdAt < ? AND NOT EXISTS (SELECT 1 FROM Email WHERE Email.messageId = Message.id AND Email.isDeleted = 0)");
        query.bind(1, (long long)cutoff);
        while (query.executeStep()) {
            ids.push_back(query.getColumn(0).getString());
        }
    }

    int collected = 0;
    for (const auto & id : ids) {
        MailStoreTransaction transaction{store, "collectOrphanMessage"};
        if (emails->collectCanonicalMessage(id)) {
            collected++;
        }
        transaction.commit();
    }
    return collected;
}

int Maintenance::sweepOrphanBlobs(time_t cutoff) {
    MailStoreTransaction transaction{store, "sweepOrphanBlobs"};

    std::vector<std::string> orphans;
    SQLite::Statement query(store->db(), "SELECT sha256 FROM Blob WHERE createdAt < ? AND NOT EXISTS (SELECT 1 FROM Message WHERE Message.rawBlobSha256 = Blob.sha256) AND NOT EXISTS (SELECT 1 FROM Attachment WHERE Attachment.blobSha256 = Blob.sha256) AND NOT EXISTS (SELECT 1 FROM AccountBlob WHERE AccountBlob.sha256 = Blob.sha256)");
    query.bind(1, (long long)cutoff);
    while (query.executeStep()) {
        orphans.push_back(query.getColumn(0).getString());
    }

    BlobStore * storage = blobs;
    for (const auto & sha : orphans) {
        SQLite::Statement del(store->db(), "DELETE FROM Blob WHERE sha256 = ?");
        del.bind(1, sha);
        del.exec();
        store->runAfterCommit([storage, sha]() {
            try {
                storage->remove(sha);
            } catch (std::exception & ex) {
                spdlog::get("logger")->warn("Unable to delete blob {} from storage: {}", sha, ex.what());
            }
        });
    }

    transaction.commit();
    return (int)orphans.size();
}
