#include "bracketeer/core/api/BracketService.h"

#include "bracketeer/core/scheduling/MatchScheduler.h"
#include "bracketeer/core/tournament/StageBuilder.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace bracketeer::core::api {

namespace {

bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

BracketService::BracketService(store::InMemoryStore& store) : store_(store) {}

void BracketService::SetLogPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_path_ = path;
}

void BracketService::SetLogSink(util::LogFn sink) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_sink_ = std::move(sink);
}

bool BracketService::BuildStageItem(model::StageItemId stage_item_id, tournament::BuildError* error) {
    const auto tournament_id = store_.TournamentOfStageItem(stage_item_id);
    if (!tournament_id) {
        return tournament::Fail(error,
                                tournament::BuildFailure::MissingStageItem,
                                "Unknown stage item " + std::to_string(stage_item_id));
    }
    auto lease = locks_.Acquire(*tournament_id);

    tournament::StageBuilder builder(store_, &round_robin_generator_, Logger());
    if (!builder.BuildMatchesForStageItem(stage_item_id, error)) {
        if (error) {
            AppendLogLine(std::string("[bracketeer] Build failed (") + tournament::BuildFailureToString(error->failure) +
                          "): " + error->message);
        }
        return false;
    }
    return true;
}

bool BracketService::BuildTournament(model::TournamentId tournament_id, tournament::BuildError* error) {
    if (!store_.GetTournament(tournament_id)) {
        return tournament::Fail(error,
                                tournament::BuildFailure::MissingStageItem,
                                "Unknown tournament " + std::to_string(tournament_id));
    }
    auto lease = locks_.Acquire(tournament_id);

    tournament::StageBuilder builder(store_, &round_robin_generator_, Logger());
    int built = 0;
    for (const auto& stage : store_.GetStages(tournament_id)) {
        for (const auto& stage_item : stage.stage_items) {
            if (!stage_item.rounds.empty()) {
                continue;
            }
            if (!builder.BuildMatchesForStageItem(stage_item.id, error)) {
                if (error) {
                    AppendLogLine("[bracketeer] Build of '" + stage_item.name + "' failed (" +
                                  tournament::BuildFailureToString(error->failure) + "): " + error->message);
                }
                return false;
            }
            ++built;
        }
    }
    AppendLogLine("[bracketeer] Built " + std::to_string(built) + " stage items for tournament " +
                  std::to_string(tournament_id));
    return true;
}

bool BracketService::PropagateResults(model::RoundId round_id,
                                      const propagation::MatchIdSet& match_ids,
                                      std::string* error) {
    const auto round = store_.GetRound(round_id);
    if (!round) {
        return SetError(error, "Unknown round " + std::to_string(round_id));
    }
    const auto tournament_id = store_.TournamentOfStageItem(round->stage_item_id);
    if (!tournament_id) {
        return SetError(error, "Round " + std::to_string(round_id) + " has no tournament");
    }
    auto lease = locks_.Acquire(*tournament_id);

    const auto stage_item = store_.GetStageItem(round->stage_item_id);
    if (!stage_item) {
        return SetError(error, "Unknown stage item " + std::to_string(round->stage_item_id));
    }
    propagation::ResultPropagator propagator(store_, Logger());
    return propagator.UpdateInputsInSubsequentRounds(round_id, *stage_item, match_ids, error);
}

bool BracketService::AutoAdvanceByes(model::StageItemId stage_item_id, int* resolved_count, std::string* error) {
    const auto tournament_id = store_.TournamentOfStageItem(stage_item_id);
    if (!tournament_id) {
        return SetError(error, "Unknown stage item " + std::to_string(stage_item_id));
    }
    auto lease = locks_.Acquire(*tournament_id);

    propagation::ResultPropagator propagator(store_, Logger());
    return propagator.AutoAdvanceByes(stage_item_id, resolved_count, error);
}

bool BracketService::ReportMatchScore(model::MatchId match_id,
                                      int score1,
                                      int score2,
                                      std::optional<int> custom_duration_minutes,
                                      std::optional<int> custom_margin_minutes,
                                      std::string* error) {
    if (score1 < 0 || score2 < 0) {
        return SetError(error, "Scores must not be negative");
    }
    if ((custom_duration_minutes && *custom_duration_minutes < 0) ||
        (custom_margin_minutes && *custom_margin_minutes < 0)) {
        return SetError(error, "Custom duration and margin must not be negative");
    }
    model::Match match;
    model::Round round;
    model::TournamentId tournament_id = 0;
    if (!TournamentOfMatch(match_id, match, round, tournament_id, error)) {
        return false;
    }
    auto lease = locks_.Acquire(tournament_id);

    // Re-read under the lease; the lookup above only fixed the tournament.
    const auto current = store_.GetMatch(match_id);
    if (!current) {
        return SetError(error, "Unknown match " + std::to_string(match_id));
    }
    if (!store_.UpdateMatchScores(match_id, score1, score2) ||
        !store_.UpdateMatchOverrides(match_id, custom_duration_minutes, custom_margin_minutes)) {
        return SetError(error, "Failed to update match " + std::to_string(match_id));
    }
    AppendLogLine("[bracketeer] Match " + std::to_string(match_id) + " scored " + std::to_string(score1) + "-" +
                  std::to_string(score2));

    const bool overrides_changed = custom_duration_minutes != current->custom_duration_minutes ||
                                   custom_margin_minutes != current->custom_margin_minutes;
    if (overrides_changed && current->court_id) {
        const auto tournament = store_.GetTournament(tournament_id);
        if (!tournament) {
            return SetError(error, "Unknown tournament " + std::to_string(tournament_id));
        }
        scheduling::MatchScheduler scheduler(store_, store_, Logger());
        const auto scheduled = scheduling::ScheduledMatches(store_.GetStages(tournament_id));
        // Matches sharing a position on other courts follow the new slot length.
        if (!scheduler.ReorderMatchesForCourt(*tournament, scheduled, *current->court_id, error) ||
            !scheduler.UpdateStartTimesOfMatches(tournament_id, error)) {
            return false;
        }
    }

    const auto stage_item = store_.GetStageItem(round.stage_item_id);
    if (!stage_item) {
        return SetError(error, "Unknown stage item " + std::to_string(round.stage_item_id));
    }
    if (!model::IsEliminationType(stage_item->type)) {
        return true;
    }

    propagation::ResultPropagator propagator(store_, Logger());
    if (!propagator.UpdateInputsInSubsequentRounds(round.id, *stage_item, std::set<model::MatchId>{match_id}, error) ||
        !propagator.AutoAdvanceByes(stage_item->id, nullptr, error)) {
        return false;
    }
    if (stage_item->type == model::StageType::DoubleElimination) {
        return propagator.MaybeAutoCompleteReset(stage_item->id, match_id, nullptr, error);
    }
    return true;
}

bool BracketService::ScheduleAllUnscheduled(model::TournamentId tournament_id, std::string* error) {
    auto lease = locks_.Acquire(tournament_id);
    scheduling::MatchScheduler scheduler(store_, store_, Logger());
    return scheduler.ScheduleAllUnscheduled(tournament_id, error);
}

bool BracketService::RescheduleMatch(model::TournamentId tournament_id,
                                     model::MatchId match_id,
                                     model::CourtId new_court_id,
                                     int new_position,
                                     std::string* error) {
    auto lease = locks_.Acquire(tournament_id);
    scheduling::MatchScheduler scheduler(store_, store_, Logger());
    return scheduler.RescheduleMatch(tournament_id, match_id, new_court_id, new_position, error);
}

bool BracketService::RenormalizeSchedule(model::TournamentId tournament_id, std::string* error) {
    auto lease = locks_.Acquire(tournament_id);
    scheduling::MatchScheduler scheduler(store_, store_, Logger());
    return scheduler.UpdateStartTimesOfMatches(tournament_id, error);
}

std::string BracketService::GetLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

bool BracketService::TournamentOfMatch(model::MatchId match_id,
                                       model::Match& match,
                                       model::Round& round,
                                       model::TournamentId& tournament_id,
                                       std::string* error) const {
    const auto found_match = store_.GetMatch(match_id);
    if (!found_match) {
        return SetError(error, "Unknown match " + std::to_string(match_id));
    }
    const auto found_round = store_.GetRound(found_match->round_id);
    if (!found_round) {
        return SetError(error, "Match " + std::to_string(match_id) + " has no round");
    }
    const auto found_tournament = store_.TournamentOfStageItem(found_round->stage_item_id);
    if (!found_tournament) {
        return SetError(error, "Match " + std::to_string(match_id) + " has no tournament");
    }
    match = *found_match;
    round = *found_round;
    tournament_id = *found_tournament;
    return true;
}

util::LogFn BracketService::Logger() {
    return [this](const std::string& line) { AppendLogLine(line); };
}

void BracketService::AppendLogLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);

    if (log_sink_) {
        log_sink_(line);
    }
    if (!log_path_.empty()) {
        const std::filesystem::path fs_path(log_path_);
        std::error_code ec;
        if (!fs_path.parent_path().empty()) {
            std::filesystem::create_directories(fs_path.parent_path(), ec);
        }
        std::ofstream output(log_path_, std::ios::binary | std::ios::app);
        if (output) {
            output << line << '\n';
        }
    }
}

}  // namespace bracketeer::core::api
