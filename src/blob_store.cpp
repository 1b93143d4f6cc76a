#include "mailjmap/blob_store.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/mail_utils.hpp"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "MailCore/MailCore.h"

FileBlobStore::FileBlobStore(std::string root) : root(root) {
    if (mkdir(root.c_str(), 0700) != 0 && errno != EEXIST) {
        throw SyncException("blob-store", "Unable to create blob directory " + root + ": " + strerror(errno), false);
    }
}

std::string FileBlobStore::pathForKey(std::string key) {
    if (!MailUtils::isBlobId(key)) {
        throw SyncException("blob-store", "Refusing to use invalid blob key " + key, false);
    }
    return root + FS_PATH_SEP + key.substr(0, 2) + FS_PATH_SEP + key;
}

void FileBlobStore::put(std::string key, const std::string & bytes) {
    mailcore::AutoreleasePool pool;
    std::string path = pathForKey(key);
    std::string dir = root + FS_PATH_SEP + key.substr(0, 2);
    if (mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST) {
        throw SyncException("blob-store", "Unable to create " + dir + ": " + strerror(errno), true);
    }

    mailcore::Data * data = mailcore::Data::dataWithBytes(bytes.data(), (unsigned int)bytes.size());
    mailcore::ErrorCode err = data->writeToFile(AS_MCSTR(path));
    if (err != mailcore::ErrorNone) {
        throw SyncException("blob-store", "Unable to write " + path, true);
    }
}

std::shared_ptr<std::string> FileBlobStore::get(std::string key) {
    mailcore::AutoreleasePool pool;
    std::string path = pathForKey(key);
    mailcore::Data * data = mailcore::Data::dataWithContentsOfFile(AS_MCSTR(path));
    if (data == nullptr) {
        return nullptr;
    }
    return std::make_shared<std::string>(data->bytes(), data->length());
}

bool FileBlobStore::exists(std::string key) {
    struct stat buffer;
    return stat(pathForKey(key).c_str(), &buffer) == 0;
}

void FileBlobStore::remove(std::string key) {
    std::string path = pathForKey(key);
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw SyncException("blob-store", "Unable to delete " + path + ": " + strerror(errno), true);
    }
}

void MemoryBlobStore::put(std::string key, const std::string & bytes) {
    objects[key] = bytes;
}

std::shared_ptr<std::string> MemoryBlobStore::get(std::string key) {
    if (!objects.count(key)) {
        return nullptr;
    }
    return std::make_shared<std::string>(objects[key]);
}

bool MemoryBlobStore::exists(std::string key) {
    return objects.count(key) > 0;
}

void MemoryBlobStore::remove(std::string key) {
    objects.erase(key);
}

size_t MemoryBlobStore::count() {
    return objects.size();
}
