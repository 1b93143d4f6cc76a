#include "mailjmap/jmap/blob_endpoints.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mail_utils.hpp"

#include <regex>
#include <sstream>

#include "spdlog/spdlog.h"

#define BLOB_CACHE_CONTROL "private, max-age=0, must-revalidate"

static EndpointResponse problem(int status, std::string type, std::string description) {
    return EndpointResponse::JSON(status, {{"type", type}, {"description", description}});
}

static bool isValidDownloadName(const std::string & name) {
    static const std::regex re("^[a-zA-Z0-9._-][a-zA-Z0-9._\\- ]{0,255}$");
    return std::regex_match(name, re);
}

static bool etagMatches(const std::string & ifNoneMatch, const std::string & etag) {
    std::stringstream ss(ifNoneMatch);
    std::string candidate;
    while (std::getline(ss, candidate, ',')) {
        candidate = MailUtils::trim(candidate);
        if (candidate == etag || candidate == "*") {
            return true;
        }
    }
    return false;
}

BlobEndpoints::BlobEndpoints(MailStore * store, BlobStore * blobs, ServerConfig * config) :
    store(store), blobs(blobs), config(config), pipeline(store, blobs)
{
}

EndpointResponse BlobEndpoints::upload(std::string accountId, std::string pathAccountId, std::string contentType, const std::string & bytes) {
    if (!MailUtils::isAccountId(pathAccountId)) {
        return problem(400, "invalidArguments", "Invalid account id");
    }
    if (pathAccountId != accountId) {
        return problem(403, "forbidden", "Account access denied");
    }
    if (bytes.size() == 0) {
        return problem(400, "invalidArguments", "Empty upload");
    }
    if ((long long)bytes.size() > config->maxSizeUpload) {
        return problem(413, "invalidArguments", "Upload too large");
    }
    if (contentType == "") {
        contentType = "application/octet-stream";
    }

    std::string sha;
    {
        MailStoreTransaction transaction{store, "blobUpload"};
        sha = pipeline.storeBlob(bytes);
        pipeline.ensureAccountBlob(accountId, sha);
        transaction.commit();
    }

    EndpointResponse response = EndpointResponse::JSON(201, {
        {"accountId", accountId},
        {"blobId", sha},
        {"type", contentType},
        {"size", bytes.size()},
    });
    response.headers["Cache-Control"] = "no-store";
    response.headers["X-Content-Type-Options"] = "nosniff";
    return response;
}

EndpointResponse BlobEndpoints::download(std::string accountId, std::string pathAccountId, std::string blobId, std::string name, std::string ifNoneMatch, std::string type) {
    if (!MailUtils::isAccountId(pathAccountId) || !MailUtils::isBlobId(blobId) || !isValidDownloadName(name)) {
        return problem(400, "invalidArguments", "Invalid download path");
    }
    if (pathAccountId != accountId) {
        return problem(403, "forbidden", "Account access denied");
    }

    SQLite::Statement grant(store->db(), "SELECT Blob.storageKey FROM AccountBlob INNER JOIN Blob ON Blob.sha256 = AccountBlob.sha256 WHERE AccountBlob.accountId = ? AND AccountBlob.sha256 = ?");
    grant.bind(1, accountId);
    grant.bind(2, blobId);
    if (!grant.executeStep()) {
        return problem(404, "notFound", "Blob not found");
    }
    std::string storageKey = grant.getColumn(0).isNull() ? blobId : grant.getColumn(0).getString();

    std::string etag = "\"" + blobId + "\"";
    if (ifNoneMatch != "" && etagMatches(ifNoneMatch, etag)) {
        EndpointResponse notModified;
        notModified.status = 304;
        notModified.headers["ETag"] = etag;
        notModified.headers["Cache-Control"] = BLOB_CACHE_CONTROL;
        return notModified;
    }

    auto data = blobs->get(storageKey);
    if (data == nullptr) {
        spdlog::get("logger")->warn("Blob {} has metadata but is missing from storage", blobId);
        return problem(404, "notFound", "Blob not found");
    }

    EndpointResponse response;
    response.status = 200;
    response.hasData = true;
    response.data = *data;
    response.headers["Content-Type"] = type == "" ? "application/octet-stream" : type;
    response.headers["ETag"] = etag;
    response.headers["Cache-Control"] = BLOB_CACHE_CONTROL;
    response.headers["X-Content-Type-Options"] = "nosniff";
    response.headers["Content-Disposition"] = "attachment; filename=\"" + MailUtils::urlEncode(name) + "\"";
    return response;
}
