#include "bracketeer/core/model/BracketTypes.h"

#include <algorithm>
#include <cctype>

namespace bracketeer::core::model {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

}  // namespace

const char* StageTypeToString(StageType type) {
    switch (type) {
        case StageType::SingleElimination:
            return "single_elimination";
        case StageType::DoubleElimination:
            return "double_elimination";
        case StageType::RoundRobin:
            return "round_robin";
        case StageType::RegularSeasonMatchup:
            return "regular_season_matchup";
        case StageType::Swiss:
            return "swiss";
    }
    return "unknown";
}

bool ParseStageType(const std::string& value, StageType& type) {
    const std::string lowered = ToLower(value);
    for (StageType candidate : {StageType::SingleElimination,
                                StageType::DoubleElimination,
                                StageType::RoundRobin,
                                StageType::RegularSeasonMatchup,
                                StageType::Swiss}) {
        if (lowered == StageTypeToString(candidate)) {
            type = candidate;
            return true;
        }
    }
    return false;
}

bool IsEliminationType(StageType type) {
    return type == StageType::SingleElimination || type == StageType::DoubleElimination;
}

MatchSide MatchSide::Direct(StageItemInputId input_id) {
    MatchSide side;
    side.source = Source::Direct;
    side.ref_id = input_id;
    side.resolved_input_id = input_id;
    return side;
}

MatchSide MatchSide::WinnerOf(MatchId match_id) {
    MatchSide side;
    side.source = Source::WinnerOf;
    side.ref_id = match_id;
    return side;
}

MatchSide MatchSide::LoserOf(MatchId match_id) {
    MatchSide side;
    side.source = Source::LoserOf;
    side.ref_id = match_id;
    return side;
}

// A tied score has no winner; a completed elimination match is never tied.
std::optional<StageItemInputId> Match::winner() const {
    if (score1 > score2) {
        return input1.resolved_input_id;
    }
    if (score2 > score1) {
        return input2.resolved_input_id;
    }
    return std::nullopt;
}

std::optional<StageItemInputId> Match::loser() const {
    if (score1 > score2) {
        return input2.resolved_input_id;
    }
    if (score2 > score1) {
        return input1.resolved_input_id;
    }
    return std::nullopt;
}

const Round* StageItem::FindRound(RoundId round_id) const {
    for (const auto& round : rounds) {
        if (round.id == round_id) {
            return &round;
        }
    }
    return nullptr;
}

int SlotMinutes(const Tournament& tournament, const Match& match) {
    const int duration = match.custom_duration_minutes.value_or(tournament.duration_minutes);
    const int margin = match.custom_margin_minutes.value_or(tournament.margin_minutes);
    return duration + margin;
}

}  // namespace bracketeer::core::model
