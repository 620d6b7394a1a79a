#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace bracketeer::core::model {

using TournamentId = int;
using StageId = int;
using StageItemId = int;
using StageItemInputId = int;
using RoundId = int;
using MatchId = int;
using CourtId = int;
using TeamId = int;

using TimePoint = std::chrono::system_clock::time_point;

enum class StageType {
    SingleElimination,
    DoubleElimination,
    RoundRobin,
    RegularSeasonMatchup,
    Swiss
};

const char* StageTypeToString(StageType type);
bool ParseStageType(const std::string& value, StageType& type);
bool IsEliminationType(StageType type);

struct Tournament {
    TournamentId id = 0;
    std::string name;
    TimePoint start_time{};
    int duration_minutes = 15;
    int margin_minutes = 5;
};

struct Court {
    CourtId id = 0;
    TournamentId tournament_id = 0;
    std::string name;
};

struct StageItemInput {
    enum class Kind {
        Empty,
        Final,
        Tentative
    };

    StageItemInputId id = 0;
    StageItemId stage_item_id = 0;
    int slot = 0;
    Kind kind = Kind::Empty;
    TeamId team_id = -1;
    StageItemId winner_from_stage_item_id = -1;
    int winner_position = 0;
};

// One side of a match. The source says where the side is fed from; the
// resolved input is the stage item input currently sitting in that side.
struct MatchSide {
    enum class Source {
        Empty,
        Direct,
        WinnerOf,
        LoserOf
    };

    Source source = Source::Empty;
    int ref_id = -1;
    std::optional<StageItemInputId> resolved_input_id;

    static MatchSide Direct(StageItemInputId input_id);
    static MatchSide WinnerOf(MatchId match_id);
    static MatchSide LoserOf(MatchId match_id);

    bool has_input() const { return resolved_input_id.has_value(); }
    bool derives_from(MatchId match_id) const {
        return (source == Source::WinnerOf || source == Source::LoserOf) && ref_id == match_id;
    }
};

struct Match {
    MatchId id = 0;
    RoundId round_id = 0;
    MatchSide input1;
    MatchSide input2;
    int score1 = 0;
    int score2 = 0;
    std::optional<CourtId> court_id;
    std::optional<TimePoint> start_time;
    std::optional<int> position_in_schedule;
    std::optional<int> custom_duration_minutes;
    std::optional<int> custom_margin_minutes;

    bool is_played() const { return score1 != 0 || score2 != 0; }
    bool is_decided() const { return score1 != score2; }
    bool is_scheduled() const { return start_time.has_value() && court_id.has_value(); }

    std::optional<StageItemInputId> winner() const;
    std::optional<StageItemInputId> loser() const;
};

// Everything needed to insert a match; the store assigns the id.
struct MatchSpec {
    RoundId round_id = 0;
    MatchSide input1;
    MatchSide input2;
    int score1 = 0;
    int score2 = 0;
    std::optional<int> custom_duration_minutes;
    std::optional<int> custom_margin_minutes;
};

struct Round {
    RoundId id = 0;
    StageItemId stage_item_id = 0;
    std::string name;
    bool is_draft = false;
    std::vector<Match> matches;
};

struct StageItem {
    StageItemId id = 0;
    StageId stage_id = 0;
    std::string name;
    StageType type = StageType::SingleElimination;
    int team_count = 0;
    std::vector<StageItemInput> inputs;
    std::vector<Round> rounds;

    const Round* FindRound(RoundId round_id) const;
};

struct Stage {
    StageId id = 0;
    TournamentId tournament_id = 0;
    std::string name;
    std::vector<StageItem> stage_items;
};

int SlotMinutes(const Tournament& tournament, const Match& match);

}  // namespace bracketeer::core::model
