/** BlobEndpoints [MailJMAP]
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

#ifndef BlobEndpoints_hpp
#define BlobEndpoints_hpp

#include <stdio.h>
#include <string>

#include "mailjmap/blob_store.hpp"
#include "mailjmap/endpoint_response.hpp"
#include "mailjmap/ingestion.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/server_config.hpp"

/**
 * JMAP binary data: POST /blobs/upload/:accountId/:type and
 * GET /blobs/download/:accountId/:blobId/:name. A blob is downloadable by an
 * account only once that account holds an AccountBlob grant for it.
 */
class BlobEndpoints {
    MailStore * store;
    BlobStore * blobs;
    ServerConfig * config;
    IngestionPipeline pipeline;

public:
    BlobEndpoints(MailStore * store, BlobStore * blobs, ServerConfig * config);

    EndpointResponse upload(std::string accountId, std::string pathAccountId, std::string contentType, const std::string & bytes);

    EndpointResponse download(std::string accountId, std::string pathAccountId, std::string blobId, std::string name, std::string ifNoneMatch, std::string type);
};

#endif /* BlobEndpoints_hpp */
