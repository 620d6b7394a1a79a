#include "bracketeer/core/tournament/StageBuilder.h"

#include "bracketeer/core/propagation/ResultPropagation.h"
#include "bracketeer/core/tournament/DoubleEliminationBuilder.h"
#include "bracketeer/core/tournament/Seeding.h"
#include "bracketeer/core/tournament/SingleEliminationBuilder.h"

namespace bracketeer::core::tournament {

namespace {

void AppendNumbered(std::vector<std::string>& names, const std::string& prefix, int count) {
    for (int index = 1; index <= count; ++index) {
        names.push_back(prefix + std::to_string(index));
    }
}

}  // namespace

StageBuilder::StageBuilder(store::IMatchStore& store, IPairingGenerator* round_robin_generator, util::LogFn log_fn)
    : store_(store), round_robin_generator_(round_robin_generator), log_fn_(std::move(log_fn)) {}

bool StageBuilder::RoundNamesForStageItem(const model::StageItem& stage_item,
                                          std::vector<std::string>& names,
                                          BuildError* error) {
    names.clear();
    switch (stage_item.type) {
        case model::StageType::RoundRobin:
        case model::StageType::RegularSeasonMatchup:
            AppendNumbered(names, "Round ", RoundRobinRoundCount(stage_item.team_count));
            return true;
        case model::StageType::SingleElimination: {
            const int rounds = SingleEliminationRoundCount(stage_item.team_count, error);
            if (rounds < 0) {
                return false;
            }
            AppendNumbered(names, "Round ", rounds);
            return true;
        }
        case model::StageType::DoubleElimination: {
            if (DoubleEliminationRoundCount(stage_item.team_count, error) < 0) {
                return false;
            }
            const int winners_round_count = SingleEliminationRoundCount(stage_item.team_count, error);
            AppendNumbered(names, "WB Round ", winners_round_count);
            AppendNumbered(names, "LB Round ", LosersBracketRoundCount(winners_round_count));
            names.push_back("Grand Final");
            names.push_back("Grand Final Reset");
            return true;
        }
        case model::StageType::Swiss:
            return true;
    }
    return Fail(error, BuildFailure::MissingStageItem, "Unknown stage type");
}

bool StageBuilder::ValidateInputCount(const model::StageItem& stage_item, BuildError* error) {
    const int input_count = static_cast<int>(stage_item.inputs.size());
    const std::string prefix = "Stage item '" + stage_item.name + "' has " + std::to_string(input_count) + " inputs";
    int minimum = 0;
    switch (stage_item.type) {
        case model::StageType::SingleElimination:
            minimum = kMinSingleEliminationTeamCount;
            break;
        case model::StageType::DoubleElimination:
            minimum = kMinDoubleEliminationTeamCount;
            break;
        case model::StageType::RoundRobin:
        case model::StageType::RegularSeasonMatchup:
            if (input_count > stage_item.team_count) {
                return Fail(error,
                            BuildFailure::TeamCountOutOfRange,
                            prefix + ", more than its team count " + std::to_string(stage_item.team_count));
            }
            return true;
        case model::StageType::Swiss:
            return true;
    }

    if (input_count > stage_item.team_count) {
        return Fail(error,
                    BuildFailure::TeamCountOutOfRange,
                    prefix + ", more than its team count " + std::to_string(stage_item.team_count));
    }
    if (!ValidateTeamCount(input_count, minimum, error)) {
        if (error) {
            error->message = prefix + ". " + error->message;
        }
        return false;
    }
    // The round count follows team_count while the first round follows the
    // inputs, so both must produce the same bracket.
    if (BracketSize(input_count) != BracketSize(stage_item.team_count)) {
        return Fail(error,
                    BuildFailure::TeamCountOutOfRange,
                    prefix + ", too few for a bracket of " + std::to_string(BracketSize(stage_item.team_count)));
    }
    return true;
}

bool StageBuilder::BuildMatchesForStageItem(model::StageItemId stage_item_id, BuildError* error) {
    auto stage_item = store_.GetStageItem(stage_item_id);
    if (!stage_item) {
        return Fail(error, BuildFailure::MissingStageItem, "Unknown stage item " + std::to_string(stage_item_id));
    }
    if (!stage_item->rounds.empty()) {
        return Fail(error,
                    BuildFailure::AlreadyBuilt,
                    "Stage item '" + stage_item->name + "' already has rounds");
    }

    std::vector<std::string> round_names;
    if (!RoundNamesForStageItem(*stage_item, round_names, error) || !ValidateInputCount(*stage_item, error)) {
        return false;
    }
    if (!CreateRounds(*stage_item, round_names, error)) {
        return false;
    }
    stage_item = store_.GetStageItem(stage_item_id);
    if (!stage_item) {
        return Fail(error, BuildFailure::MissingStageItem, "Stage item " + std::to_string(stage_item_id) + " disappeared");
    }

    switch (stage_item->type) {
        case model::StageType::SingleElimination: {
            SingleEliminationBuilder builder(store_, log_fn_);
            if (!builder.Build(*stage_item, error)) {
                return false;
            }
            return SettleEliminationStageItem(*stage_item, error);
        }
        case model::StageType::DoubleElimination: {
            DoubleEliminationBuilder builder(store_, log_fn_);
            if (!builder.Build(*stage_item, error)) {
                return false;
            }
            return SettleEliminationStageItem(*stage_item, error);
        }
        case model::StageType::RoundRobin:
        case model::StageType::RegularSeasonMatchup:
            return BuildGeneratedMatches(*stage_item, error);
        case model::StageType::Swiss:
            return true;
    }
    return Fail(error, BuildFailure::MissingStageItem, "Unknown stage type");
}

bool StageBuilder::CreateRounds(const model::StageItem& stage_item,
                                const std::vector<std::string>& names,
                                BuildError* error) {
    for (const auto& name : names) {
        if (!store_.CreateRound(stage_item.id, name, false)) {
            return Fail(error, BuildFailure::StoreFailure, "Failed to create round '" + name + "'");
        }
    }
    util::Emit(log_fn_,
               "[builder] Created " + std::to_string(names.size()) + " rounds for '" + stage_item.name + "' (" +
                   model::StageTypeToString(stage_item.type) + ")");
    return true;
}

bool StageBuilder::BuildGeneratedMatches(const model::StageItem& stage_item, BuildError* error) {
    if (round_robin_generator_ == nullptr) {
        return true;
    }
    const int round_count = static_cast<int>(stage_item.rounds.size());
    const auto generated = round_robin_generator_->BuildMatches(stage_item, round_count);
    for (const auto& entry : generated) {
        if (entry.round_index < 0 || entry.round_index >= round_count) {
            return Fail(error,
                        BuildFailure::RoundCountMismatch,
                        "Generated match refers to round index " + std::to_string(entry.round_index));
        }
        model::MatchSpec spec;
        spec.round_id = stage_item.rounds[static_cast<size_t>(entry.round_index)].id;
        spec.input1 = model::MatchSide::Direct(entry.input1_id);
        spec.input2 = model::MatchSide::Direct(entry.input2_id);
        if (!store_.CreateMatch(spec)) {
            return Fail(error, BuildFailure::StoreFailure, "Failed to create generated match");
        }
    }
    util::Emit(log_fn_,
               "[builder] Inserted " + std::to_string(generated.size()) + " generated matches for '" +
                   stage_item.name + "'");
    return true;
}

bool StageBuilder::SettleEliminationStageItem(const model::StageItem& stage_item, BuildError* error) {
    propagation::ResultPropagator propagator(store_, log_fn_);
    std::string propagation_error;
    if (!propagator.UpdateInputsInCompleteStageItem(stage_item.id, &propagation_error) ||
        !propagator.AutoAdvanceByes(stage_item.id, nullptr, &propagation_error)) {
        return Fail(error, BuildFailure::PropagationFailure, propagation_error);
    }
    return true;
}

}  // namespace bracketeer::core::tournament
