/** BlobStore [MailJMAP]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef BlobStore_hpp
#define BlobStore_hpp

#include <stdio.h>
#include <string>
#include <map>
#include <memory>

/**
 * Content-addressed object storage. Keys are the sha-256 hex digests stored
 * in Blob.storageKey. Metadata lives in the MailStore, this class only moves
 * bytes.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual void put(std::string key, const std::string & bytes) = 0;

    // Returns nullptr when the object does not exist.
    virtual std::shared_ptr<std::string> get(std::string key) = 0;

    virtual bool exists(std::string key) = 0;

    virtual void remove(std::string key) = 0;
};

class FileBlobStore : public BlobStore {
    std::string root;

public:
    FileBlobStore(std::string root);

    void put(std::string key, const std::string & bytes) override;
    std::shared_ptr<std::string> get(std::string key) override;
    bool exists(std::string key) override;
    void remove(std::string key) override;

private:
    std::string pathForKey(std::string key);
};

// In-process store for tests.
class MemoryBlobStore : public BlobStore {
    std::map<std::string, std::string> objects;

public:
    void put(std::string key, const std::string & bytes) override;
    std::shared_ptr<std::string> get(std::string key) override;
    bool exists(std::string key) override;
    void remove(std::string key) override;

    size_t count();
};

#endif /* BlobStore_hpp */
