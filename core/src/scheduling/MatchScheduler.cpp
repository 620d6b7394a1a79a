#include "bracketeer/core/scheduling/MatchScheduler.h"

#include <algorithm>
#include <chrono>
#include <optional>

namespace bracketeer::core::scheduling {

namespace {

bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

model::TimePoint AddMinutes(model::TimePoint time, int minutes) {
    return time + std::chrono::minutes(minutes);
}

template <typename T, typename Compare>
std::vector<T> SortedCopy(std::vector<T> values, Compare compare) {
    std::stable_sort(values.begin(), values.end(), compare);
    return values;
}

}  // namespace

std::vector<MatchPosition> ScheduledMatches(const std::vector<model::Stage>& stages) {
    std::vector<MatchPosition> scheduled;
    for (const auto& stage : stages) {
        for (const auto& item : stage.stage_items) {
            for (const auto& round : item.rounds) {
                for (const auto& match : round.matches) {
                    if (!match.start_time) {
                        continue;
                    }
                    MatchPosition entry;
                    entry.match = match;
                    entry.position = static_cast<double>(match.position_in_schedule.value_or(0));
                    scheduled.push_back(std::move(entry));
                }
            }
        }
    }
    return scheduled;
}

std::map<model::CourtId, std::vector<MatchPosition>> ScheduledMatchesPerCourt(const std::vector<model::Stage>& stages) {
    std::map<model::CourtId, std::vector<MatchPosition>> per_court;
    for (auto& entry : ScheduledMatches(stages)) {
        if (entry.match.court_id) {
            per_court[*entry.match.court_id].push_back(std::move(entry));
        }
    }
    for (auto& entry : per_court) {
        std::stable_sort(entry.second.begin(), entry.second.end(), [](const auto& a, const auto& b) {
            return *a.match.start_time < *b.match.start_time;
        });
    }
    return per_court;
}

MatchScheduler::MatchScheduler(store::IMatchStore& store,
                               const store::ITournamentDirectory& directory,
                               util::LogFn log_fn)
    : store_(store), directory_(directory), log_fn_(std::move(log_fn)) {}

bool MatchScheduler::ScheduleAllUnscheduled(model::TournamentId tournament_id, std::string* error) {
    const auto tournament = directory_.GetTournament(tournament_id);
    if (!tournament) {
        return SetError(error, "Unknown tournament " + std::to_string(tournament_id));
    }
    const auto courts = directory_.ListCourts(tournament_id);
    const auto stages = store_.GetStages(tournament_id);
    if (stages.empty() || courts.empty()) {
        util::Emit(log_fn_, "[scheduler] Nothing to schedule: no stages or no courts");
        return true;
    }

    model::TimePoint time_last_match_from_previous_stage = tournament->start_time;
    int position_last_match_from_previous_stage = 0;
    int newly_scheduled = 0;

    for (const auto& stage : stages) {
        const auto stage_items = SortedCopy(stage.stage_items, [](const auto& a, const auto& b) {
            return a.name < b.name;
        });
        model::TimePoint stage_start_time = time_last_match_from_previous_stage;
        int stage_position_in_schedule = position_last_match_from_previous_stage;

        for (const auto& stage_item : stage_items) {
            model::TimePoint round_start_time = stage_start_time;
            int round_position_in_schedule = stage_position_in_schedule;

            const auto rounds = SortedCopy(stage_item.rounds, [](const auto& a, const auto& b) {
                return a.id < b.id;
            });
            for (const auto& round : rounds) {
                const auto matches = SortedCopy(round.matches, [](const auto& a, const auto& b) {
                    return a.id < b.id;
                });
                if (matches.empty()) {
                    continue;
                }

                model::TimePoint batch_start_time = round_start_time;
                int batch_count = 0;
                for (size_t start = 0; start < matches.size(); start += courts.size()) {
                    const size_t end = std::min(matches.size(), start + courts.size());
                    const int position_in_schedule = round_position_in_schedule + batch_count;
                    model::TimePoint slot_end_time = batch_start_time;

                    for (size_t i = start; i < end; ++i) {
                        const auto& match = matches[i];
                        const auto& court = courts[i - start];
                        if (!match.start_time && !match.position_in_schedule) {
                            if (!store_.UpdateMatchSchedule(match.id, court.id, batch_start_time, position_in_schedule)) {
                                return SetError(error, "Failed to schedule match " + std::to_string(match.id));
                            }
                            ++newly_scheduled;
                        }
                        slot_end_time = std::max(slot_end_time,
                                                 AddMinutes(batch_start_time, model::SlotMinutes(*tournament, match)));
                    }

                    batch_start_time = slot_end_time;
                    ++batch_count;
                }

                round_start_time = batch_start_time;
                round_position_in_schedule += batch_count;
            }

            stage_start_time = round_start_time;
            stage_position_in_schedule = round_position_in_schedule;
        }

        time_last_match_from_previous_stage = std::max(time_last_match_from_previous_stage, stage_start_time);
        position_last_match_from_previous_stage =
            std::max(position_last_match_from_previous_stage, stage_position_in_schedule);
    }

    util::Emit(log_fn_,
               "[scheduler] Scheduled " + std::to_string(newly_scheduled) + " matches on " +
                   std::to_string(courts.size()) + " courts");
    return UpdateStartTimesOfMatches(tournament_id, error);
}

bool MatchScheduler::RescheduleMatch(model::TournamentId tournament_id,
                                     model::MatchId match_id,
                                     model::CourtId new_court_id,
                                     int new_position,
                                     std::string* error) {
    const auto tournament = directory_.GetTournament(tournament_id);
    if (!tournament) {
        return SetError(error, "Unknown tournament " + std::to_string(tournament_id));
    }
    const auto match = store_.GetMatch(match_id);
    if (!match) {
        return SetError(error, "Unknown match " + std::to_string(match_id));
    }
    const auto courts = directory_.ListCourts(tournament_id);
    const bool court_known = std::any_of(courts.begin(), courts.end(), [new_court_id](const auto& court) {
        return court.id == new_court_id;
    });
    if (!court_known) {
        return SetError(error, "Court " + std::to_string(new_court_id) + " is not part of the tournament");
    }

    const std::optional<model::CourtId> old_court_id = match->is_scheduled() ? match->court_id : std::nullopt;
    const std::optional<int> old_position = match->is_scheduled() ? match->position_in_schedule : std::nullopt;
    if (old_court_id == new_court_id && old_position == new_position) {
        return true;
    }

    // The half offset lands the match before the occupant of new_position
    // when moving up or across courts, after it when moving down.
    const bool moving_up = !old_position || new_position < *old_position;
    const double offset = (moving_up || old_court_id != new_court_id) ? -0.5 : 0.5;

    auto scheduled_matches = ScheduledMatches(store_.GetStages(tournament_id));
    bool found = false;
    for (auto& entry : scheduled_matches) {
        if (entry.match.id == match_id) {
            entry.match.court_id = new_court_id;
            entry.position = new_position + offset;
            found = true;
        }
    }
    if (!found) {
        MatchPosition entry;
        entry.match = *match;
        entry.match.court_id = new_court_id;
        entry.position = new_position + offset;
        scheduled_matches.push_back(std::move(entry));
    }

    if (!ReorderMatchesForCourt(*tournament, scheduled_matches, new_court_id, error)) {
        return false;
    }
    if (old_court_id && *old_court_id != new_court_id &&
        !ReorderMatchesForCourt(*tournament, scheduled_matches, *old_court_id, error)) {
        return false;
    }

    util::Emit(log_fn_,
               "[scheduler] Moved match " + std::to_string(match_id) + " to court " + std::to_string(new_court_id) +
                   " position " + std::to_string(new_position));
    return UpdateStartTimesOfMatches(tournament_id, error);
}

bool MatchScheduler::ReorderMatchesForCourt(const model::Tournament& tournament,
                                            const std::vector<MatchPosition>& scheduled_matches,
                                            model::CourtId court_id,
                                            std::string* error) {
    std::vector<MatchPosition> matches_this_court;
    for (const auto& entry : scheduled_matches) {
        if (entry.match.court_id == court_id) {
            matches_this_court.push_back(entry);
        }
    }
    std::stable_sort(matches_this_court.begin(), matches_this_court.end(), [](const auto& a, const auto& b) {
        return a.position < b.position;
    });

    model::TimePoint last_start_time = tournament.start_time;
    for (size_t i = 0; i < matches_this_court.size(); ++i) {
        const auto& match = matches_this_court[i].match;
        if (!store_.UpdateMatchSchedule(match.id, court_id, last_start_time, static_cast<int>(i))) {
            return SetError(error, "Failed to reschedule match " + std::to_string(match.id));
        }
        last_start_time = AddMinutes(last_start_time, model::SlotMinutes(tournament, match));
    }
    return true;
}

bool MatchScheduler::UpdateStartTimesOfMatches(model::TournamentId tournament_id, std::string* error) {
    const auto tournament = directory_.GetTournament(tournament_id);
    if (!tournament) {
        return SetError(error, "Unknown tournament " + std::to_string(tournament_id));
    }

    std::map<int, std::vector<model::Match>> matches_by_position;
    for (const auto& entry : ScheduledMatches(store_.GetStages(tournament_id))) {
        const auto& match = entry.match;
        if (!match.court_id || !match.position_in_schedule) {
            continue;
        }
        matches_by_position[*match.position_in_schedule].push_back(match);
    }
    if (matches_by_position.empty()) {
        return true;
    }

    model::TimePoint slot_start_time = tournament->start_time;
    int normalized_slot = 0;
    for (auto& entry : matches_by_position) {
        auto& slot_matches = entry.second;
        std::sort(slot_matches.begin(), slot_matches.end(), [](const auto& a, const auto& b) {
            if (*a.court_id != *b.court_id) {
                return *a.court_id < *b.court_id;
            }
            return a.id < b.id;
        });

        int longest_slot_minutes = 0;
        for (const auto& match : slot_matches) {
            if (!store_.UpdateMatchSchedule(match.id, *match.court_id, slot_start_time, normalized_slot)) {
                return SetError(error, "Failed to update start time of match " + std::to_string(match.id));
            }
            longest_slot_minutes = std::max(longest_slot_minutes, model::SlotMinutes(*tournament, match));
        }
        slot_start_time = AddMinutes(slot_start_time, longest_slot_minutes);
        ++normalized_slot;
    }
    return true;
}

}  // namespace bracketeer::core::scheduling
