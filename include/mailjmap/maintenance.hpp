/** Maintenance [MailJMAP]
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

#ifndef Maintenance_hpp
#define Maintenance_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/blob_store.hpp"
#include "mailjmap/email_engine.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/server_config.hpp"

struct MaintenanceReport {
    int orphanMessages = 0;
    int orphanBlobs = 0;

    nlohmann::json toJSON() const {
        return {{"orphanMessages", orphanMessages}, {"orphanBlobs", orphanBlobs}};
    }
};

/**
 * Periodic cleanup run after each scheduler tick. Only rows older than
 * orphanBlobGraceSeconds are considered, so work an in-flight request has
 * not committed yet is never collected.
 */
class Maintenance {
    MailStore * store;
    BlobStore * blobs;
    ServerConfig * config;
    EmailEngine * emails;

public:
    Maintenance(MailStore * store, BlobStore * blobs, ServerConfig * config, EmailEngine * emails);

    MaintenanceReport run(time_t now);

    // Canonical messages no live Email points at.
    int collectOrphanMessages(time_t cutoff);

    // Blobs no Message, Attachment or account grant references.
    int sweepOrphanBlobs(time_t cutoff);
};

#endif /* Maintenance_hpp */
