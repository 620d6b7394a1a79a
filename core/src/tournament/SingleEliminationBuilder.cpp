#include "bracketeer/core/tournament/SingleEliminationBuilder.h"

#include "bracketeer/core/tournament/Seeding.h"

#include <algorithm>
#include <map>
#include <optional>

namespace bracketeer::core::tournament {

bool CreateMatches(store::IMatchStore& store,
                   const std::vector<model::MatchSpec>& specs,
                   std::vector<model::Match>& created,
                   BuildError* error) {
    created.clear();
    created.reserve(specs.size());
    for (const auto& spec : specs) {
        auto match = store.CreateMatch(spec);
        if (!match) {
            return Fail(error,
                        BuildFailure::StoreFailure,
                        "Failed to create match in round " + std::to_string(spec.round_id));
        }
        created.push_back(std::move(*match));
    }
    return true;
}

SingleEliminationBuilder::SingleEliminationBuilder(store::IMatchStore& store, util::LogFn log_fn)
    : store_(store), log_fn_(std::move(log_fn)) {}

std::vector<model::MatchSpec> SingleEliminationBuilder::FirstRoundMatches(
    model::RoundId round_id,
    std::vector<model::StageItemInput> inputs,
    int bracket_size) {
    std::stable_sort(inputs.begin(), inputs.end(), [](const auto& a, const auto& b) {
        return a.slot < b.slot;
    });

    std::map<int, model::StageItemInputId> seed_lookup;
    for (size_t i = 0; i < inputs.size(); ++i) {
        seed_lookup[static_cast<int>(i) + 1] = inputs[i].id;
    }
    auto lookup = [&seed_lookup](int seed) -> std::optional<model::StageItemInputId> {
        auto it = seed_lookup.find(seed);
        if (it == seed_lookup.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    std::vector<model::MatchSpec> specs;
    if (bracket_size < 2) {
        return specs;
    }
    const auto seeds = SeedOrder(bracket_size);
    for (size_t i = 0; i + 1 < seeds.size(); i += 2) {
        auto input1 = lookup(seeds[i]);
        auto input2 = lookup(seeds[i + 1]);
        if (!input1 && !input2) {
            continue;
        }
        if (!input1) {
            std::swap(input1, input2);
        }

        model::MatchSpec spec;
        spec.round_id = round_id;
        spec.input1 = model::MatchSide::Direct(*input1);
        if (input2) {
            spec.input2 = model::MatchSide::Direct(*input2);
        } else {
            spec.score1 = 1;
        }
        specs.push_back(spec);
    }
    return specs;
}

bool SingleEliminationBuilder::SubsequentRoundMatches(const std::vector<model::Match>& previous_matches,
                                                      model::RoundId round_id,
                                                      std::vector<model::MatchSpec>& specs,
                                                      BuildError* error) {
    specs.clear();
    if (previous_matches.size() % 2 != 0) {
        return Fail(error,
                    BuildFailure::OddMatchCount,
                    "Cannot generate elimination round from an odd number of matches");
    }
    for (size_t i = 0; i < previous_matches.size(); i += 2) {
        model::MatchSpec spec;
        spec.round_id = round_id;
        spec.input1 = model::MatchSide::WinnerOf(previous_matches[i].id);
        spec.input2 = model::MatchSide::WinnerOf(previous_matches[i + 1].id);
        specs.push_back(spec);
    }
    return true;
}

bool SingleEliminationBuilder::Build(const model::StageItem& stage_item, BuildError* error) {
    const auto rounds = store_.GetRoundsForStageItem(stage_item.id);
    if (rounds.empty()) {
        return Fail(error,
                    BuildFailure::MissingRound,
                    "Stage item " + std::to_string(stage_item.id) + " has no rounds");
    }

    const int bracket_size = BracketSize(static_cast<int>(stage_item.inputs.size()));
    std::vector<model::Match> previous;
    if (!CreateMatches(store_, FirstRoundMatches(rounds.front().id, stage_item.inputs, bracket_size), previous, error)) {
        return false;
    }

    for (size_t i = 1; i < rounds.size(); ++i) {
        std::vector<model::MatchSpec> specs;
        if (!SubsequentRoundMatches(previous, rounds[i].id, specs, error)) {
            return false;
        }
        if (!CreateMatches(store_, specs, previous, error)) {
            return false;
        }
    }

    util::Emit(log_fn_,
               "[builder] Single elimination '" + stage_item.name + "' built: " +
                   std::to_string(rounds.size()) + " rounds, bracket size " + std::to_string(bracket_size));
    return true;
}

}  // namespace bracketeer::core::tournament
