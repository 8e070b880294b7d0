/*
 @ 0xCCCCCCCC
*/

#include <iostream>
#include <string>
#include <vector>

#include "kbase/file_util.h"
#include "kbase/logging.h"
#include "kbase/path.h"
#include "kbase/string_util.h"

#include "shield_engine/engine_config.h"
#include "shield_engine/engine_errors.h"
#include "shield_engine/filter_engine.h"

namespace {

constexpr const char kConfigSwitch[] = "--config=";
constexpr const char kLoadStateSwitch[] = "--load-state=";
constexpr const char kSaveStateSwitch[] = "--save-state=";
constexpr const char kNoRefreshSwitch[] = "--no-refresh";

constexpr const int kExitUsage = 1;
constexpr const int kExitFailure = 2;

struct Options {
    std::string config_file;
    std::string load_state_file;
    std::string save_state_file;
    bool refresh = true;
    std::vector<std::string> request;
};

std::string SwitchValue(const std::string& arg, const char* name)
{
    return arg.substr(std::char_traits<char>::length(name));
}

bool ParseOptions(int argc, char* argv[], Options& options)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (kbase::StartsWith(arg, kConfigSwitch)) {
            options.config_file = SwitchValue(arg, kConfigSwitch);
        } else if (kbase::StartsWith(arg, kLoadStateSwitch)) {
            options.load_state_file = SwitchValue(arg, kLoadStateSwitch);
        } else if (kbase::StartsWith(arg, kSaveStateSwitch)) {
            options.save_state_file = SwitchValue(arg, kSaveStateSwitch);
        } else if (arg == kNoRefreshSwitch) {
            options.refresh = false;
        } else if (kbase::StartsWith(arg, "--")) {
            return false;
        } else {
            options.request.push_back(std::move(arg));
        }
    }

    return options.request.size() == 3;
}

void PrintUsage()
{
    std::cerr << "Usage: kshield [--config=<file>] [--load-state=<file>] [--save-state=<file>]"
              << " [--no-refresh] <url> <resource-type> <origin-domain>\n";
}

void PrintRefreshReport(const sse::RefreshReport& report)
{
    for (const auto& outcome : report) {
        if (outcome.succeeded) {
            std::cout << "-> " << outcome.list_id << ": " << outcome.rule_count << " rules\n";
        } else {
            std::cout << "-> " << outcome.list_id << ": "
                      << sse::ErrorKindName(outcome.error_kind) << " error, "
                      << outcome.error_message << "\n";
        }
    }
}

void PrintFilterLists(const std::vector<sse::FilterListStatus>& lists)
{
    for (const auto& list : lists) {
        std::cout << (list.enabled ? "[on]  " : "[off] ") << list.id << " " << list.rule_count
                  << " rules, updated " << sse::FormatTimestamp(list.last_updated) << "\n";
    }
}

int Run(const Options& options)
{
    auto config = options.config_file.empty() ?
                  sse::DefaultEngineConfig() :
                  sse::LoadEngineConfig(kbase::Path(options.config_file));

    sse::FilterEngine engine(config);

    if (!options.load_state_file.empty()) {
        std::string state = kbase::ReadFileToString(kbase::Path(options.load_state_file));
        engine.ImportState(state.data(), state.size());
    }

    if (options.refresh) {
        PrintRefreshReport(engine.RefreshFilterListsAsync().get());
    }

    PrintFilterLists(engine.GetFilterLists());

    const auto& url = options.request[0];
    const auto& resource_type = options.request[1];
    const auto& origin_domain = options.request[2];
    auto decision = engine.CheckRequest(url, resource_type, origin_domain);
    std::cout << (decision.blocked ? "block" : "allow") << " " << url << " ("
              << sse::DecisionReasonName(decision.reason);
    if (!decision.rule_text.empty()) {
        std::cout << ": " << decision.rule_text << " in " << decision.list_id;
    }

    std::cout << ")\n";

    if (!options.save_state_file.empty()) {
        auto snapshot = engine.ExportState();
        std::string state(static_cast<const char*>(snapshot.data()), snapshot.size());
        kbase::WriteStringToFile(kbase::Path(options.save_state_file), state);
    }

    return 0;
}

}   // namespace

int main(int argc, char* argv[])
{
    Options options;
    if (!ParseOptions(argc, argv, options)) {
        PrintUsage();
        return kExitUsage;
    }

    try {
        return Run(options);
    } catch (const sse::EngineError& ex) {
        LOG(ERROR) << "kshield failed; " << sse::ErrorKindName(ex.kind()) << ": " << ex.what();
        std::cerr << ex.what() << "\n";
        return kExitFailure;
    }
}
