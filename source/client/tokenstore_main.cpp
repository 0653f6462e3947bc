#include <string>
#include <cstdio>
#include <vector>

#include <lap/core/CTypedef.hpp>
#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include "CTokenStorage.hpp"

using namespace lap;
using namespace lap::tks;

void printUsage(const char* programName) {
    printf("Usage: %s [options] <command> [args...]\n", programName);
    printf("\n");
    printf("Commands:\n");
    printf("  salt                         Print the store salt, creating or migrating the file\n");
    printf("  list                         List the key of every record\n");
    printf("  dump                         Print all records as JSON\n");
    printf("  count                        Print the number of records\n");
    printf("  import <file>                Replace all records with the JSON array in <file>\n");
    printf("  merge <file> [--single]      Merge the JSON array in <file> into the store\n");
    printf("                               (--single: apply only its first element)\n");
    printf("\n");
    printf("Options:\n");
    printf("  -d, --data-dir <dir>         Data directory (default: from config, %s)\n", LAP_TKS_DEFAULT_DATA_DIR);
    printf("  -f, --file <name>            Store file name or absolute path (default: %s)\n", LAP_TKS_DEFAULT_FILE_NAME);
    printf("  -h, --help                   Show this help message\n");
    printf("\n");
    printf("Examples:\n");
    printf("  %s salt\n", programName);
    printf("  %s -d /var/lib/app list\n", programName);
    printf("  %s import accounts_backup.json\n", programName);
    printf("  %s merge active.json --single\n", programName);
}

bool loadRecordsFromFile(const std::string& path, RecordList& records) {
    if (!core::File::Util::exists(path.c_str())) {
        fprintf(stderr, "Error: File not found: %s\n", path.c_str());
        return false;
    }

    core::Vector<core::UInt8> data;
    if (!core::File::Util::ReadBinary(path, data)) {
        fprintf(stderr, "Error: Failed to read %s\n", path.c_str());
        return false;
    }

    try {
        auto json = nlohmann::json::parse(data.begin(), data.end());
        if (!json.is_array()) {
            fprintf(stderr, "Error: %s does not contain a JSON array\n", path.c_str());
            return false;
        }
        records = TokenStore::NormalizeRecords(json);
    } catch (const nlohmann::json::parse_error& e) {
        fprintf(stderr, "Error: Invalid JSON in %s: %s\n", path.c_str(), e.what());
        return false;
    }

    return true;
}

std::string keyToString(const Record& record, const std::string& keyField) {
    if (!record.is_object() || !record.contains(keyField)) return "<no key>";

    const auto& key = record[keyField];
    return key.is_string() ? key.get<std::string>() : key.dump();
}

int main(int argc, char* argv[]) {
    std::string dataDir;
    std::string fileName;
    bool single = false;
    std::vector<std::string> args;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--data-dir") {
            if (i + 1 < argc) {
                dataDir = argv[++i];
            } else {
                fprintf(stderr, "Error: --data-dir requires an argument\n");
                printUsage(argv[0]);
                return 1;
            }
        } else if (arg == "-f" || arg == "--file") {
            if (i + 1 < argc) {
                fileName = argv[++i];
            } else {
                fprintf(stderr, "Error: --file requires an argument\n");
                printUsage(argv[0]);
                return 1;
            }
        } else if (arg == "--single") {
            single = true;
        } else if (arg.find("-") == 0) {
            fprintf(stderr, "Error: Unknown option %s\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        fprintf(stderr, "Error: No command specified\n");
        printUsage(argv[0]);
        return 1;
    }

    // Initialize logging system
    ::lap::log::LogManager::getInstance().initialize();

    auto& manager = CTokenStoreManager::getInstance();
    manager.initialize();

    const auto& config = manager.getConfig();
    if (dataDir.empty()) dataDir = config.dataDir;
    if (fileName.empty()) fileName = config.fileName;

    std::string storePath = (fileName[0] == '/') ? fileName
                                                 : std::string(core::Path::appendString(dataDir, fileName));

    auto storeResult = manager.getTokenStoreByPath(storePath, true);
    if (!storeResult.HasValue()) {
        fprintf(stderr, "Error: Failed to open store %s: %s\n",
                storePath.c_str(), std::string(storeResult.Error().Message()).c_str());
        return 1;
    }

    auto store = storeResult.Value();
    std::string command = args[0];
    int status = 0;

    try {
        if (command == "salt") {
            printf("%s\n", store->GetSalt().c_str());

        } else if (command == "list") {
            auto records = store->ReadAll();
            if (records.empty()) {
                printf("No records found\n");
            } else {
                for (const auto& record : records) {
                    printf("%s\n", keyToString(record, config.keyField).c_str());
                }
            }

        } else if (command == "dump") {
            nlohmann::json array = store->ReadAll();
            printf("%s\n", array.dump(config.jsonIndent).c_str());

        } else if (command == "count") {
            printf("%zu\n", store->ReadAll().size());

        } else if (command == "import") {
            if (args.size() < 2) {
                fprintf(stderr, "Error: import command requires a file\n");
                return 1;
            }

            RecordList records;
            if (!loadRecordsFromFile(args[1], records)) return 1;

            auto result = store->WriteAll(records).get();
            if (result.HasValue()) {
                printf("Imported %zu record(s)\n", records.size());
            } else {
                fprintf(stderr, "Error: Failed to import records: %s\n", std::string(result.Error().Message()).c_str());
                status = 1;
            }

        } else if (command == "merge") {
            if (args.size() < 2) {
                fprintf(stderr, "Error: merge command requires a file\n");
                return 1;
            }

            RecordList records;
            if (!loadRecordsFromFile(args[1], records)) return 1;

            Record singleRecord;
            if (single) {
                if (records.empty()) {
                    fprintf(stderr, "Error: --single requires a non-empty array\n");
                    return 1;
                }
                singleRecord = records.front();
            }

            auto result = store->Merge(records, singleRecord).get();
            if (!result.HasValue()) {
                fprintf(stderr, "Error: Failed to merge records: %s\n", std::string(result.Error().Message()).c_str());
                status = 1;
            } else if (result.Value() == MergeStatus::kSkipped) {
                fprintf(stderr, "Error: Merge skipped, store file is unreadable\n");
                status = 1;
            } else {
                printf("Merge applied\n");
            }

        } else {
            fprintf(stderr, "Error: Unknown command '%s'\n", command.c_str());
            printUsage(argv[0]);
            status = 1;
        }

    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        status = 1;
    }

    manager.uninitialize();

    return status;
}
