#include <getopt.h>
#include <unistd.h>
#include <functional>
#include <iostream>
#include <string>
#include <time.h>
#include <sqlite3.h>

#include <SQLiteCpp/SQLiteCpp.h>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/stdout_sinks.h"

#include "mailjmap/account_registry.hpp"
#include "mailjmap/blob_store.hpp"
#include "mailjmap/change_log.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/email_engine.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/mailbox_engine.hpp"
#include "mailjmap/maintenance.hpp"
#include "mailjmap/server_config.hpp"
#include "mailjmap/ses_transport.hpp"
#include "mailjmap/ses_webhook.hpp"
#include "mailjmap/sns_verifier.hpp"
#include "mailjmap/submission_engine.hpp"
#include "mailjmap/submission_queue.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/jmap/blob_endpoints.hpp"
#include "mailjmap/jmap/dispatcher.hpp"
#include "mailjmap/jmap/session.hpp"

using namespace std;
using json = nlohmann::json;

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path mailjmap [options]\n\n" \
    "Options:\n" \
    "  --help, -h       Print usage and exit.\n" \
    "  --verbose, -v    Log debug messages.\n" \
    "  --orphan, -o     Log to the console instead of mailjmap.log.\n" \
    "  --config, -c     Path to config.json. Defaults to CONFIG_DIR_PATH/config.json.\n" \
    "  --mode, -m       Required: serve, migrate or tick.\n" \
    "\n" \
    "In serve mode, mailjmap reads one JSON packet per line on stdin and writes\n" \
    "one JSON response per line on stdout.\n"

class Services {
public:
    ServerConfig config;
    MailStore store;
    FileBlobStore blobs;
    ChangeLog changes;
    EmailEngine emails;
    MailboxEngine mailboxes;
    SubmissionEngine submissions;
    SesTransport transport;
    SubmissionQueue queue;
    SnsCertificateCache certificates;
    SesWebhook webhook;
    Maintenance maintenance;
    JMAPDispatcher dispatcher;
    JMAPSession session;
    BlobEndpoints blobEndpoints;
    AccountRegistry registry;

    Services(ServerConfig c) :
        config(c),
        store(config.databasePath()),
        blobs(config.blobDir),
        changes(&store),
        emails(&store, &blobs, &config, &changes),
        mailboxes(&store, &changes, &emails),
        submissions(&store, &changes),
        transport(&config, &blobs),
        queue(&store, &changes, &transport),
        certificates(),
        webhook(&store, &changes, &config, &certificates),
        maintenance(&store, &blobs, &config, &emails),
        dispatcher(&changes, &emails, &mailboxes, &submissions),
        session(&store, &changes, &config),
        blobEndpoints(&store, &blobs, &config),
        registry(&store, &emails)
    {
        store.migrate();
    }
};

string configPathFromOptions(string option) {
    if (option != "") {
        return option;
    }
    string dir = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    return dir + FS_PATH_SEP + "config.json";
}

ServerConfig loadConfig(string path) {
    ServerConfig config;
    if (access(path.c_str(), R_OK) == 0) {
        config = ServerConfig::FromFile(path);
    } else {
        config = ServerConfig::FromJSON(json::object(), MailUtils::getEnvUTF8("CONFIG_DIR_PATH"));
    }
    config.applyEnvironment();
    return config;
}

int runSingleFunctionAndExit(std::function<void()> fn) {
    json resp = {{"error", nullptr}};
    int code = 0;
    try {
        fn();
    } catch (std::exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    cout << "\n" << resp.dump();
    return code;
}

json runSchedulerTick(Services & services) {
    time_t now = time(0);
    int processed = services.queue.processQueue(services.config.schedulerBatchSize, now);
    MaintenanceReport report = services.maintenance.run(now);
    return {{"processed", processed}, {"maintenance", report.toJSON()}};
}

EndpointResponse handlePacket(Services & services, string configPath, const json & packet) {
    string type = packet.value("type", "");
    string accountId = packet.value("accountId", "");

    if (type == "jmap") {
        if (!packet.count("body")) {
            throw JMAPError("notRequest", "jmap packets need a body");
        }
        return services.dispatcher.handle(accountId, packet["body"]);
    }
    if (type == "session") {
        return EndpointResponse::JSON(200, services.session.build(accountId, packet.value("baseUrl", "")));
    }
    if (type == "upload") {
        string bytes = MailUtils::fromBase64(packet.value("dataBase64", ""));
        return services.blobEndpoints.upload(accountId, packet.value("pathAccountId", ""), packet.value("contentType", ""), bytes);
    }
    if (type == "download") {
        return services.blobEndpoints.download(accountId, packet.value("pathAccountId", ""), packet.value("blobId", ""), packet.value("name", ""), packet.value("ifNoneMatch", ""), packet.value("contentType", ""));
    }
    if (type == "ses-events") {
        string body = packet.count("body") && packet["body"].is_string() ? packet["body"].get<string>() : packet.value("body", json()).dump();
        return services.webhook.handle(packet.value("token", ""), body);
    }
    if (type == "ingest") {
        string raw = MailUtils::fromBase64(packet.value("dataBase64", ""));
        if (raw.size() == 0) {
            throw JMAPError("invalidArguments", "ingest packets need dataBase64");
        }
        EmailCreated created = services.emails.deliver(accountId, raw, packet.value("mailboxRole", "inbox"));
        return EndpointResponse::JSON(201, created.toJSON());
    }
    if (type == "register-account") {
        RegisteredAccount registered = services.registry.registerAccount(accountId, packet.value("emailAddress", ""), packet.value("name", ""));
        return EndpointResponse::JSON(201, registered.toJSON());
    }
    if (type == "scheduler-tick") {
        return EndpointResponse::JSON(200, runSchedulerTick(services));
    }
    if (type == "reload-config") {
        services.config = loadConfig(configPath);
        services.certificates.invalidate();
        return EndpointResponse::JSON(200, services.config.toJSON());
    }
    throw JMAPError("invalidArguments", "Unknown packet type " + type);
}

void runListenOnMainThread(Services & services, string configPath) {
    auto logger = spdlog::get("logger");

    while (true) {
        string inputLine;
        if (!getline(cin, inputLine)) {
            logger->info("stdin closed, exiting.");
            return;
        }
        if (inputLine == "") {
            continue;
        }

        json packet;
        try {
            packet = json::parse(inputLine);
        } catch (json::exception & ex) {
            json resp = {{"error", ex.what()}};
            logger->error(resp.dump());
            cout << resp.dump() << endl;
            continue;
        }

        EndpointResponse response;
        try {
            response = handlePacket(services, configPath, packet);
        } catch (JMAPError & err) {
            response = EndpointResponse::JSON(err.httpStatus(), err.toJSON());
        } catch (SyncException & ex) {
            logger->error("{} packet failed: {}", packet.value("type", ""), ex.toJSON().dump());
            response = EndpointResponse::JSON(ex.httpStatus(), {{"type", "serverError"}, {"description", ex.debuginfo}});
        } catch (SQLite::Exception & ex) {
            logger->error("{} packet failed with a database error: {}", packet.value("type", ""), ex.what());
            response = EndpointResponse::JSON(500, {{"type", "serverError"}, {"description", "Database error"}});
        } catch (std::exception & ex) {
            logger->error("{} packet failed: {}", packet.value("type", ""), ex.what());
            response = EndpointResponse::JSON(500, {{"type", "serverError"}, {"description", ex.what()}});
        }

        json resp = response.toJSON();
        if (packet.count("requestId")) {
            resp["requestId"] = packet["requestId"];
        }
        cout << resp.dump() << endl;
    }
}

int main(int argc, char * argv[]) {
    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"verbose", no_argument, nullptr, 'v'},
        {"orphan", no_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"mode", required_argument, nullptr, 'm'},
        {nullptr, 0, nullptr, 0},
    };

    string mode = "";
    string configOption = "";
    bool verbose = false;
    bool orphan = false;
    bool help = false;

    int c;
    while ((c = getopt_long(argc, argv, "hvoc:m:", longOptions, nullptr)) != -1) {
        switch (c) {
            case 'h': help = true; break;
            case 'v': verbose = true; break;
            case 'o': orphan = true; break;
            case 'c': configOption = optarg; break;
            case 'm': mode = optarg; break;
            default:
                cout << USAGE_STRING;
                return 1;
        }
    }

    if (help || mode == "") {
        cout << USAGE_STRING;
        return 1;
    }

    // check required environment
    string eConfigDirPath = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (eConfigDirPath == "" && configOption == "") {
        cout << USAGE_STRING;
        return 1;
    }

    string configPath = configPathFromOptions(configOption);
    ServerConfig config;
    try {
        config = loadConfig(configPath);
    } catch (SyncException & ex) {
        json resp = {{"error", ex.debuginfo}};
        cout << "\n" << resp.dump();
        return 1;
    }

    // keep SQLite temp files beside the database
    if (config.dataDir != "") {
        sqlite3_temp_directory = sqlite3_mprintf("%s", config.dataDir.c_str());
    }

    // setup logging to file or console
    std::vector<spdlog::sink_ptr> sinks;
    string pattern = "%+";

    if (!orphan) {
        string logPath = config.dataDir + FS_PATH_SEP + "mailjmap.log";
        sinks.push_back(make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
    } else {
        // attached to a console, log everything to stdout in an abbreviated format
        pattern = "%l: %v";
        sinks.push_back(make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    // Always log critical errors to stderr as well as the log file / stdout.
    auto stderr_sink = make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_pattern(pattern);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::flush_every(std::chrono::seconds(30));

    if (mode == "migrate") {
        return runSingleFunctionAndExit([&](){
            MailStore store(config.databasePath());
            int from = store.schemaVersion();
            store.migrate();
            logger->info("Migrated {} from schema version {} to {}", config.databasePath(), from, store.schemaVersion());
        });
    }

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);

    if (mode == "tick") {
        return runSingleFunctionAndExit([&](){
            Services services(config);
            json result = runSchedulerTick(services);
            logger->info("Scheduler tick: {}", result.dump());
        });
    }

    if (mode == "serve") {
        logger->info("------------- Starting MailJMAP ({}) ---------------", config.databasePath());
        return runSingleFunctionAndExit([&](){
            Services services(config);
            runListenOnMainThread(services, configPath);
        });
    }

    cout << USAGE_STRING;
    return 1;
}
