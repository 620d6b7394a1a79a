#include "bracketeer/core/store/InMemoryStore.h"

#include <algorithm>

namespace bracketeer::core::store {

namespace {

template <typename Map>
std::vector<typename Map::mapped_type> Values(const Map& map) {
    std::vector<typename Map::mapped_type> values;
    values.reserve(map.size());
    for (const auto& entry : map) {
        values.push_back(entry.second);
    }
    return values;
}

template <typename Entity, typename Map>
bool InsertUnique(const std::vector<Entity>& entities, Map& map, const char* kind, std::string* error) {
    for (const auto& entity : entities) {
        if (!map.emplace(entity.id, entity).second) {
            if (error) {
                *error = std::string("Duplicate ") + kind + " id " + std::to_string(entity.id);
            }
            return false;
        }
    }
    return true;
}

template <typename Map>
int MaxKey(const Map& map) {
    return map.empty() ? 0 : map.rbegin()->first;
}

}  // namespace

std::optional<model::Tournament> InMemoryStore::AddTournament(model::Tournament tournament) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tournament.id <= 0) {
        tournament.id = next_id_++;
    } else if (tournaments_.count(tournament.id) > 0) {
        return std::nullopt;
    }
    next_id_ = std::max(next_id_, tournament.id + 1);
    tournaments_[tournament.id] = tournament;
    return tournament;
}

std::optional<model::Court> InMemoryStore::AddCourt(model::TournamentId tournament_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tournaments_.count(tournament_id) == 0) {
        return std::nullopt;
    }
    model::Court court;
    court.id = next_id_++;
    court.tournament_id = tournament_id;
    court.name = name;
    courts_[court.id] = court;
    return court;
}

std::optional<model::Stage> InMemoryStore::AddStage(model::TournamentId tournament_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tournaments_.count(tournament_id) == 0) {
        return std::nullopt;
    }
    model::Stage stage;
    stage.id = next_id_++;
    stage.tournament_id = tournament_id;
    stage.name = name;
    stages_[stage.id] = stage;
    return stage;
}

std::optional<model::StageItem> InMemoryStore::AddStageItem(model::StageId stage_id,
                                                            const std::string& name,
                                                            model::StageType type,
                                                            int team_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stages_.count(stage_id) == 0) {
        return std::nullopt;
    }
    model::StageItem item;
    item.id = next_id_++;
    item.stage_id = stage_id;
    item.name = name;
    item.type = type;
    item.team_count = team_count;
    stage_items_[item.id] = item;
    return item;
}

std::optional<model::StageItemInput> InMemoryStore::AddStageItemInput(model::StageItemInput input) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_items_.count(input.stage_item_id) == 0) {
        return std::nullopt;
    }
    for (const auto& entry : inputs_) {
        if (entry.second.stage_item_id == input.stage_item_id && entry.second.slot == input.slot) {
            return std::nullopt;
        }
    }
    input.id = next_id_++;
    inputs_[input.id] = input;
    return input;
}

std::vector<model::Tournament> InMemoryStore::ListTournaments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Values(tournaments_);
}

std::vector<model::StageItemInput> InMemoryStore::GetInputsForStageItem(model::StageItemId stage_item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::StageItemInput> inputs;
    for (const auto& entry : inputs_) {
        if (entry.second.stage_item_id == stage_item_id) {
            inputs.push_back(entry.second);
        }
    }
    return inputs;
}

InMemoryStore::Contents InMemoryStore::Export() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Contents contents;
    contents.tournaments = Values(tournaments_);
    contents.courts = Values(courts_);
    contents.stages = Values(stages_);
    contents.stage_items = Values(stage_items_);
    contents.inputs = Values(inputs_);
    contents.rounds = Values(rounds_);
    contents.matches = Values(matches_);
    return contents;
}

bool InMemoryStore::Import(const Contents& contents, std::string* error) {
    std::map<model::TournamentId, model::Tournament> tournaments;
    std::map<model::CourtId, model::Court> courts;
    std::map<model::StageId, model::Stage> stages;
    std::map<model::StageItemId, model::StageItem> stage_items;
    std::map<model::StageItemInputId, model::StageItemInput> inputs;
    std::map<model::RoundId, model::Round> rounds;
    std::map<model::MatchId, model::Match> matches;

    if (!InsertUnique(contents.tournaments, tournaments, "tournament", error) ||
        !InsertUnique(contents.courts, courts, "court", error) ||
        !InsertUnique(contents.stages, stages, "stage", error) ||
        !InsertUnique(contents.stage_items, stage_items, "stage item", error) ||
        !InsertUnique(contents.inputs, inputs, "stage item input", error) ||
        !InsertUnique(contents.rounds, rounds, "round", error) ||
        !InsertUnique(contents.matches, matches, "match", error)) {
        return false;
    }

    for (auto& entry : stage_items) {
        entry.second.inputs.clear();
        entry.second.rounds.clear();
    }
    for (auto& entry : stages) {
        entry.second.stage_items.clear();
    }
    for (auto& entry : rounds) {
        entry.second.matches.clear();
    }

    for (const auto& entry : matches) {
        if (rounds.count(entry.second.round_id) == 0) {
            if (error) {
                *error = "Match " + std::to_string(entry.first) + " refers to unknown round";
            }
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tournaments_ = std::move(tournaments);
    courts_ = std::move(courts);
    stages_ = std::move(stages);
    stage_items_ = std::move(stage_items);
    inputs_ = std::move(inputs);
    rounds_ = std::move(rounds);
    matches_ = std::move(matches);
    next_id_ = 1 + std::max({MaxKey(tournaments_),
                             MaxKey(courts_),
                             MaxKey(stages_),
                             MaxKey(stage_items_),
                             MaxKey(inputs_),
                             MaxKey(rounds_),
                             MaxKey(matches_)});
    return true;
}

std::optional<model::Round> InMemoryStore::CreateRound(model::StageItemId stage_item_id,
                                                       const std::string& name,
                                                       bool is_draft) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_items_.count(stage_item_id) == 0) {
        return std::nullopt;
    }
    model::Round round;
    round.id = next_id_++;
    round.stage_item_id = stage_item_id;
    round.name = name;
    round.is_draft = is_draft;
    rounds_[round.id] = round;
    return round;
}

std::optional<model::Match> InMemoryStore::CreateMatch(const model::MatchSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rounds_.count(spec.round_id) == 0) {
        return std::nullopt;
    }
    model::Match match;
    match.id = next_id_++;
    match.round_id = spec.round_id;
    match.input1 = spec.input1;
    match.input2 = spec.input2;
    match.score1 = spec.score1;
    match.score2 = spec.score2;
    match.custom_duration_minutes = spec.custom_duration_minutes;
    match.custom_margin_minutes = spec.custom_margin_minutes;
    matches_[match.id] = match;
    return match;
}

bool InMemoryStore::UpdateMatchInputs(model::MatchId match_id,
                                      std::optional<model::StageItemInputId> input1_id,
                                      std::optional<model::StageItemInputId> input2_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match_id);
    if (it == matches_.end()) {
        return false;
    }
    it->second.input1.resolved_input_id = input1_id;
    it->second.input2.resolved_input_id = input2_id;
    return true;
}

bool InMemoryStore::UpdateMatchScores(model::MatchId match_id, int score1, int score2) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match_id);
    if (it == matches_.end()) {
        return false;
    }
    it->second.score1 = score1;
    it->second.score2 = score2;
    return true;
}

bool InMemoryStore::UpdateMatchOverrides(model::MatchId match_id,
                                         std::optional<int> custom_duration_minutes,
                                         std::optional<int> custom_margin_minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match_id);
    if (it == matches_.end()) {
        return false;
    }
    it->second.custom_duration_minutes = custom_duration_minutes;
    it->second.custom_margin_minutes = custom_margin_minutes;
    return true;
}

bool InMemoryStore::UpdateMatchSchedule(model::MatchId match_id,
                                        model::CourtId court_id,
                                        model::TimePoint start_time,
                                        int position_in_schedule) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match_id);
    if (it == matches_.end() || courts_.count(court_id) == 0) {
        return false;
    }
    it->second.court_id = court_id;
    it->second.start_time = start_time;
    it->second.position_in_schedule = position_in_schedule;
    return true;
}

bool InMemoryStore::ClearMatchSchedule(model::MatchId match_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match_id);
    if (it == matches_.end()) {
        return false;
    }
    it->second.court_id.reset();
    it->second.start_time.reset();
    it->second.position_in_schedule.reset();
    return true;
}

std::optional<model::Match> InMemoryStore::GetMatch(model::MatchId match_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = matches_.find(match_id);
    if (it == matches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<model::Round> InMemoryStore::GetRound(model::RoundId round_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(round_id);
    if (it == rounds_.end()) {
        return std::nullopt;
    }
    model::Round round = it->second;
    for (const auto& entry : matches_) {
        if (entry.second.round_id == round_id) {
            round.matches.push_back(entry.second);
        }
    }
    return round;
}

std::vector<model::Round> InMemoryStore::GetRoundsForStageItem(model::StageItemId stage_item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RoundsLocked(stage_item_id);
}

std::optional<model::StageItem> InMemoryStore::GetStageItem(model::StageItemId stage_item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StageItemLocked(stage_item_id);
}

std::vector<model::Stage> InMemoryStore::GetStages(model::TournamentId tournament_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Stage> stages;
    for (const auto& stage_entry : stages_) {
        if (stage_entry.second.tournament_id != tournament_id) {
            continue;
        }
        model::Stage stage = stage_entry.second;
        for (const auto& item_entry : stage_items_) {
            if (item_entry.second.stage_id == stage.id) {
                auto item = StageItemLocked(item_entry.first);
                if (item) {
                    stage.stage_items.push_back(std::move(*item));
                }
            }
        }
        stages.push_back(std::move(stage));
    }
    return stages;
}

std::optional<model::TournamentId> InMemoryStore::TournamentOfStageItem(model::StageItemId stage_item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto item_it = stage_items_.find(stage_item_id);
    if (item_it == stage_items_.end()) {
        return std::nullopt;
    }
    auto stage_it = stages_.find(item_it->second.stage_id);
    if (stage_it == stages_.end()) {
        return std::nullopt;
    }
    return stage_it->second.tournament_id;
}

std::optional<model::Tournament> InMemoryStore::GetTournament(model::TournamentId tournament_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tournaments_.find(tournament_id);
    if (it == tournaments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::Court> InMemoryStore::ListCourts(model::TournamentId tournament_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Court> courts;
    for (const auto& entry : courts_) {
        if (entry.second.tournament_id == tournament_id) {
            courts.push_back(entry.second);
        }
    }
    return courts;
}

std::vector<model::Round> InMemoryStore::RoundsLocked(model::StageItemId stage_item_id) const {
    std::vector<model::Round> rounds;
    std::map<model::RoundId, size_t> index_by_id;
    for (const auto& entry : rounds_) {
        if (entry.second.stage_item_id == stage_item_id) {
            index_by_id[entry.first] = rounds.size();
            rounds.push_back(entry.second);
        }
    }
    for (const auto& entry : matches_) {
        auto it = index_by_id.find(entry.second.round_id);
        if (it != index_by_id.end()) {
            rounds[it->second].matches.push_back(entry.second);
        }
    }
    return rounds;
}

std::optional<model::StageItem> InMemoryStore::StageItemLocked(model::StageItemId stage_item_id) const {
    auto it = stage_items_.find(stage_item_id);
    if (it == stage_items_.end()) {
        return std::nullopt;
    }
    model::StageItem item = it->second;
    for (const auto& entry : inputs_) {
        if (entry.second.stage_item_id == stage_item_id) {
            item.inputs.push_back(entry.second);
        }
    }
    std::sort(item.inputs.begin(), item.inputs.end(), [](const auto& a, const auto& b) {
        return a.slot < b.slot;
    });
    item.rounds = RoundsLocked(stage_item_id);
    return item;
}

}  // namespace bracketeer::core::store
