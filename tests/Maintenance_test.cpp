#include "MailJMAPTestFixture.hpp"
#include "mailjmap/maintenance.hpp"

class MaintenanceTest : public MailJMAPTest {
protected:
    int countRows(std::string sql) {
        SQLite::Statement query(store->db(), sql);
        query.executeStep();
        return query.getColumn(0).getInt();
    }

    time_t afterGrace() {
        return time(0) + config.orphanBlobGraceSeconds + 60;
    }
};

TEST_F(MaintenanceTest, LeavesRecentOrphansAlone) {
    IngestionPipeline pipeline{store, blobs};
    {
        MailStoreTransaction transaction{store, "testIngest"};
        pipeline.storeBlob("stray bytes");
        pipeline.ingest(TEST_ACCOUNT_ID, rawMessage("Unreferenced", "unref@example.com"));
        transaction.commit();
    }

    Maintenance maintenance{store, blobs, &config, emails};
    MaintenanceReport report = maintenance.run(time(0));
    EXPECT_EQ(report.orphanMessages, 0);
    EXPECT_EQ(report.orphanBlobs, 0);
    EXPECT_EQ(blobs->count(), 2);
}

TEST_F(MaintenanceTest, CollectsOrphanMessagesAndBlobs) {
    std::string inbox = createMailbox("Inbox", "inbox");
    json kept = importEmail(rawMessage("Kept", "kept@example.com"), inbox);

    IngestionPipeline pipeline{store, blobs};
    std::string stray;
    {
        MailStoreTransaction transaction{store, "testIngest"};
        stray = pipeline.storeBlob("stray bytes");
        pipeline.ingest(TEST_ACCOUNT_ID, rawMessage("Unreferenced", "unref@example.com"));
        transaction.commit();
    }
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Message"), 2);

    Maintenance maintenance{store, blobs, &config, emails};
    MaintenanceReport report = maintenance.run(afterGrace());
    EXPECT_EQ(report.orphanMessages, 1);
    EXPECT_EQ(report.orphanBlobs, 1);
    EXPECT_EQ(report.toJSON()["orphanMessages"], 1);

    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Message"), 1);
    EXPECT_FALSE(blobs->exists(stray));
    EXPECT_TRUE(blobs->exists(kept["blobId"].get<std::string>()));
    EXPECT_EQ(blobs->count(), 1);

    MaintenanceReport again = maintenance.run(afterGrace());
    EXPECT_EQ(again.orphanMessages, 0);
    EXPECT_EQ(again.orphanBlobs, 0);
}

TEST_F(MaintenanceTest, KeepsGrantedUploads) {
    std::string uploaded = uploadBlob("uploaded but unused");

    Maintenance maintenance{store, blobs, &config, emails};
    MaintenanceReport report = maintenance.run(afterGrace());
    EXPECT_EQ(report.orphanBlobs, 0);
    EXPECT_TRUE(blobs->exists(uploaded));
}
