#include "bracketeer/core/api/BracketService.h"
#include "bracketeer/core/api/TournamentConfig.h"
#include "bracketeer/core/persist/StoreSnapshot.h"
#include "bracketeer/core/store/InMemoryStore.h"
#include "bracketeer/core/util/NumberParse.h"
#include "bracketeer/core/util/TimeFormat.h"

#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using bracketeer::core::api::BracketService;
using bracketeer::core::api::TournamentConfig;
using bracketeer::core::store::InMemoryStore;
namespace model = bracketeer::core::model;
using bracketeer::core::util::ParseInt;
namespace persist = bracketeer::core::persist;

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  bracketeercli build <config.json>\n"
              << "  bracketeercli score <snapshot.json> <match_id> <score1> <score2> [--duration N] [--margin N]\n"
              << "  bracketeercli reschedule <snapshot.json> <match_id> <court_id> <position>\n"
              << "  bracketeercli renormalize <snapshot.json>\n"
              << "  bracketeercli show <snapshot.json>\n";
}

void AttachConsole(BracketService& service) {
    service.SetLogSink([](const std::string& line) { std::cout << line << '\n'; });
}

bool LoadStore(const std::string& path, InMemoryStore& store) {
    std::string error;
    if (!persist::LoadSnapshot(path, store, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return false;
    }
    return true;
}

bool SaveStore(const std::string& path, const InMemoryStore& store) {
    std::string error;
    if (!persist::SaveSnapshot(path, store, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return false;
    }
    std::cout << "[bracketeercli] Snapshot written: " << path << '\n';
    return true;
}

std::optional<model::TournamentId> TournamentOfMatch(const InMemoryStore& store, model::MatchId match_id) {
    const auto match = store.GetMatch(match_id);
    if (!match) {
        return std::nullopt;
    }
    const auto round = store.GetRound(match->round_id);
    if (!round) {
        return std::nullopt;
    }
    return store.TournamentOfStageItem(round->stage_item_id);
}

int RunBuild(const std::string& config_path) {
    std::cout << "[bracketeercli] Tournament config: " << config_path << '\n';

    TournamentConfig config;
    std::string error;
    if (!TournamentConfig::LoadFromFile(config_path, config, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return 1;
    }

    InMemoryStore store;
    bracketeer::core::api::AppliedTournament applied;
    if (!bracketeer::core::api::ApplyConfigToStore(config, store, applied, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return 1;
    }

    BracketService service(store);
    AttachConsole(service);
    service.SetLogPath(config.output.log_path);

    bracketeer::core::tournament::BuildError build_error;
    if (!service.BuildTournament(applied.tournament_id, &build_error)) {
        std::cerr << "[bracketeercli] " << build_error.message << '\n';
        return 1;
    }
    if (!service.ScheduleAllUnscheduled(applied.tournament_id, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return 1;
    }
    return SaveStore(config.output.snapshot_json, store) ? 0 : 1;
}

int RunScore(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        PrintUsage();
        return 1;
    }
    int match_id = 0;
    int score1 = 0;
    int score2 = 0;
    if (!ParseInt(args[1], match_id) || !ParseInt(args[2], score1) || !ParseInt(args[3], score2)) {
        std::cerr << "[bracketeercli] Match id and scores must be integers." << '\n';
        return 1;
    }

    InMemoryStore store;
    if (!LoadStore(args[0], store)) {
        return 1;
    }
    const auto match = store.GetMatch(match_id);
    if (!match) {
        std::cerr << "[bracketeercli] Unknown match " << match_id << '\n';
        return 1;
    }

    std::optional<int> duration = match->custom_duration_minutes;
    std::optional<int> margin = match->custom_margin_minutes;
    for (size_t i = 4; i < args.size(); ++i) {
        int value = 0;
        if ((args[i] == "--duration" || args[i] == "--margin") && i + 1 < args.size() && ParseInt(args[i + 1], value)) {
            (args[i] == "--duration" ? duration : margin) = value;
            ++i;
        } else {
            std::cerr << "[bracketeercli] Unexpected argument: " << args[i] << '\n';
            return 1;
        }
    }

    BracketService service(store);
    AttachConsole(service);
    std::string error;
    if (!service.ReportMatchScore(match_id, score1, score2, duration, margin, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return 1;
    }
    return SaveStore(args[0], store) ? 0 : 1;
}

int RunReschedule(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        PrintUsage();
        return 1;
    }
    int match_id = 0;
    int court_id = 0;
    int position = 0;
    if (!ParseInt(args[1], match_id) || !ParseInt(args[2], court_id) || !ParseInt(args[3], position)) {
        std::cerr << "[bracketeercli] Match id, court id and position must be integers." << '\n';
        return 1;
    }

    InMemoryStore store;
    if (!LoadStore(args[0], store)) {
        return 1;
    }
    const auto tournament_id = TournamentOfMatch(store, match_id);
    if (!tournament_id) {
        std::cerr << "[bracketeercli] Unknown match " << match_id << '\n';
        return 1;
    }

    BracketService service(store);
    AttachConsole(service);
    std::string error;
    if (!service.RescheduleMatch(*tournament_id, match_id, court_id, position, &error)) {
        std::cerr << "[bracketeercli] " << error << '\n';
        return 1;
    }
    return SaveStore(args[0], store) ? 0 : 1;
}

int RunRenormalize(const std::string& snapshot_path) {
    InMemoryStore store;
    if (!LoadStore(snapshot_path, store)) {
        return 1;
    }
    BracketService service(store);
    AttachConsole(service);
    for (const auto& tournament : store.ListTournaments()) {
        std::string error;
        if (!service.RenormalizeSchedule(tournament.id, &error)) {
            std::cerr << "[bracketeercli] " << error << '\n';
            return 1;
        }
    }
    return SaveStore(snapshot_path, store) ? 0 : 1;
}

std::string DescribeInput(const std::map<model::StageItemInputId, model::StageItemInput>& inputs,
                          const model::MatchSide& side) {
    if (!side.resolved_input_id) {
        switch (side.source) {
            case model::MatchSide::Source::WinnerOf:
                return "(winner of #" + std::to_string(side.ref_id) + ")";
            case model::MatchSide::Source::LoserOf:
                return "(loser of #" + std::to_string(side.ref_id) + ")";
            default:
                return "(empty)";
        }
    }
    const auto it = inputs.find(*side.resolved_input_id);
    if (it == inputs.end()) {
        return "input " + std::to_string(*side.resolved_input_id);
    }
    const auto& input = it->second;
    if (input.kind == model::StageItemInput::Kind::Final) {
        return "team " + std::to_string(input.team_id);
    }
    if (input.kind == model::StageItemInput::Kind::Tentative) {
        return "#" + std::to_string(input.winner_position) + " of item " +
               std::to_string(input.winner_from_stage_item_id);
    }
    return "slot " + std::to_string(input.slot);
}

int RunShow(const std::string& snapshot_path) {
    InMemoryStore store;
    if (!LoadStore(snapshot_path, store)) {
        return 1;
    }

    for (const auto& tournament : store.ListTournaments()) {
        std::cout << "Tournament " << tournament.id << " '" << tournament.name << "' starts "
                  << bracketeer::core::util::FormatUtcTimestamp(tournament.start_time) << '\n';
        std::map<model::CourtId, std::string> court_names;
        for (const auto& court : store.ListCourts(tournament.id)) {
            court_names[court.id] = court.name;
        }

        for (const auto& stage : store.GetStages(tournament.id)) {
            std::cout << "  Stage '" << stage.name << "'\n";
            for (const auto& item : stage.stage_items) {
                std::cout << "    " << item.name << " (" << model::StageTypeToString(item.type) << ", "
                          << item.team_count << " teams)\n";
                std::map<model::StageItemInputId, model::StageItemInput> inputs;
                for (const auto& input : item.inputs) {
                    inputs[input.id] = input;
                }
                for (const auto& round : item.rounds) {
                    std::cout << "      " << round.name << '\n';
                    for (const auto& match : round.matches) {
                        std::ostringstream line;
                        line << "        #" << match.id << ' ' << DescribeInput(inputs, match.input1) << " vs "
                             << DescribeInput(inputs, match.input2) << "  " << match.score1 << '-' << match.score2;
                        if (match.is_scheduled()) {
                            line << "  @ " << court_names[*match.court_id] << ' '
                                 << bracketeer::core::util::FormatUtcTimestamp(*match.start_time);
                            if (match.position_in_schedule) {
                                line << " pos " << *match.position_in_schedule;
                            }
                        }
                        std::cout << line.str() << '\n';
                    }
                }
            }
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }

    const std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    if (command == "build") {
        return RunBuild(args[0]);
    }
    if (command == "score") {
        return RunScore(args);
    }
    if (command == "reschedule") {
        return RunReschedule(args);
    }
    if (command == "renormalize") {
        return RunRenormalize(args[0]);
    }
    if (command == "show") {
        return RunShow(args[0]);
    }

    std::cerr << "[bracketeercli] Unknown command: " << command << '\n';
    PrintUsage();
    return 1;
}
