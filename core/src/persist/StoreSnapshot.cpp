#include "bracketeer/core/persist/StoreSnapshot.h"

#include "bracketeer/core/util/AtomicFileWriter.h"
#include "bracketeer/core/util/TimeFormat.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace bracketeer::core::persist {

namespace {

using model::MatchSide;
using model::StageItemInput;

const char* SourceToString(MatchSide::Source source) {
    switch (source) {
        case MatchSide::Source::Empty:
            return "empty";
        case MatchSide::Source::Direct:
            return "direct";
        case MatchSide::Source::WinnerOf:
            return "winner_of";
        case MatchSide::Source::LoserOf:
            return "loser_of";
    }
    return "empty";
}

bool ParseSource(const std::string& value, MatchSide::Source& source) {
    for (auto candidate : {MatchSide::Source::Empty,
                           MatchSide::Source::Direct,
                           MatchSide::Source::WinnerOf,
                           MatchSide::Source::LoserOf}) {
        if (value == SourceToString(candidate)) {
            source = candidate;
            return true;
        }
    }
    return false;
}

const char* InputKindToString(StageItemInput::Kind kind) {
    switch (kind) {
        case StageItemInput::Kind::Empty:
            return "empty";
        case StageItemInput::Kind::Final:
            return "final";
        case StageItemInput::Kind::Tentative:
            return "tentative";
    }
    return "empty";
}

bool ParseInputKind(const std::string& value, StageItemInput::Kind& kind) {
    for (auto candidate : {StageItemInput::Kind::Empty, StageItemInput::Kind::Final, StageItemInput::Kind::Tentative}) {
        if (value == InputKindToString(candidate)) {
            kind = candidate;
            return true;
        }
    }
    return false;
}

template <typename T>
nlohmann::json Nullable(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
std::optional<T> ReadNullable(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<T>();
}

nlohmann::json WriteSide(const MatchSide& side) {
    return {
        {"source", SourceToString(side.source)},
        {"ref_id", side.ref_id},
        {"resolved_input_id", Nullable(side.resolved_input_id)},
    };
}

bool ReadSide(const nlohmann::json& node, MatchSide& side, std::string* error) {
    if (!ParseSource(node.value("source", "empty"), side.source)) {
        if (error) {
            *error = "Unknown match side source: " + node.value("source", "");
        }
        return false;
    }
    side.ref_id = node.value("ref_id", -1);
    side.resolved_input_id = ReadNullable<int>(node, "resolved_input_id");
    return true;
}

nlohmann::json WriteTime(const std::optional<model::TimePoint>& time) {
    if (!time) {
        return nullptr;
    }
    return util::FormatUtcTimestamp(*time);
}

bool ReadTime(const nlohmann::json& node, const char* key, std::optional<model::TimePoint>& time, std::string* error) {
    time.reset();
    if (!node.contains(key) || node.at(key).is_null()) {
        return true;
    }
    const auto text = node.at(key).get<std::string>();
    model::TimePoint parsed;
    if (!util::ParseUtcTimestamp(text, parsed)) {
        if (error) {
            *error = std::string("Invalid timestamp for ") + key + ": " + text;
        }
        return false;
    }
    time = parsed;
    return true;
}

bool Decode(const nlohmann::json& root, store::InMemoryStore::Contents& contents, std::string* error) {
    const int version = root.value("version", 0);
    if (version != kSnapshotVersion) {
        if (error) {
            *error = "Unsupported snapshot version " + std::to_string(version);
        }
        return false;
    }

    contents = store::InMemoryStore::Contents{};

    for (const auto& node : root.value("tournaments", nlohmann::json::array())) {
        model::Tournament tournament;
        tournament.id = node.at("id").get<int>();
        tournament.name = node.value("name", "");
        std::optional<model::TimePoint> start_time;
        if (!ReadTime(node, "start_time", start_time, error)) {
            return false;
        }
        tournament.start_time = start_time.value_or(model::TimePoint{});
        tournament.duration_minutes = node.value("duration_minutes", tournament.duration_minutes);
        tournament.margin_minutes = node.value("margin_minutes", tournament.margin_minutes);
        contents.tournaments.push_back(std::move(tournament));
    }

    for (const auto& node : root.value("courts", nlohmann::json::array())) {
        model::Court court;
        court.id = node.at("id").get<int>();
        court.tournament_id = node.at("tournament_id").get<int>();
        court.name = node.value("name", "");
        contents.courts.push_back(std::move(court));
    }

    for (const auto& node : root.value("stages", nlohmann::json::array())) {
        model::Stage stage;
        stage.id = node.at("id").get<int>();
        stage.tournament_id = node.at("tournament_id").get<int>();
        stage.name = node.value("name", "");
        contents.stages.push_back(std::move(stage));
    }

    for (const auto& node : root.value("stage_items", nlohmann::json::array())) {
        model::StageItem item;
        item.id = node.at("id").get<int>();
        item.stage_id = node.at("stage_id").get<int>();
        item.name = node.value("name", "");
        const std::string type = node.value("type", "");
        if (!model::ParseStageType(type, item.type)) {
            if (error) {
                *error = "Unknown stage item type: " + type;
            }
            return false;
        }
        item.team_count = node.value("team_count", 0);
        contents.stage_items.push_back(std::move(item));
    }

    for (const auto& node : root.value("inputs", nlohmann::json::array())) {
        StageItemInput input;
        input.id = node.at("id").get<int>();
        input.stage_item_id = node.at("stage_item_id").get<int>();
        input.slot = node.value("slot", 0);
        const std::string kind = node.value("kind", "empty");
        if (!ParseInputKind(kind, input.kind)) {
            if (error) {
                *error = "Unknown stage item input kind: " + kind;
            }
            return false;
        }
        input.team_id = node.value("team_id", -1);
        input.winner_from_stage_item_id = node.value("winner_from_stage_item_id", -1);
        input.winner_position = node.value("winner_position", 0);
        contents.inputs.push_back(std::move(input));
    }

    for (const auto& node : root.value("rounds", nlohmann::json::array())) {
        model::Round round;
        round.id = node.at("id").get<int>();
        round.stage_item_id = node.at("stage_item_id").get<int>();
        round.name = node.value("name", "");
        round.is_draft = node.value("is_draft", false);
        contents.rounds.push_back(std::move(round));
    }

    for (const auto& node : root.value("matches", nlohmann::json::array())) {
        model::Match match;
        match.id = node.at("id").get<int>();
        match.round_id = node.at("round_id").get<int>();
        if (!ReadSide(node.at("input1"), match.input1, error) || !ReadSide(node.at("input2"), match.input2, error)) {
            return false;
        }
        match.score1 = node.value("score1", 0);
        match.score2 = node.value("score2", 0);
        match.court_id = ReadNullable<int>(node, "court_id");
        if (!ReadTime(node, "start_time", match.start_time, error)) {
            return false;
        }
        match.position_in_schedule = ReadNullable<int>(node, "position_in_schedule");
        match.custom_duration_minutes = ReadNullable<int>(node, "custom_duration_minutes");
        match.custom_margin_minutes = ReadNullable<int>(node, "custom_margin_minutes");
        if (match.start_time.has_value() != match.court_id.has_value()) {
            if (error) {
                *error = "Match " + std::to_string(match.id) + " has a start time without a court or vice versa";
            }
            return false;
        }
        contents.matches.push_back(std::move(match));
    }
    return true;
}

}  // namespace

std::string SnapshotToJsonString(const store::InMemoryStore::Contents& contents) {
    nlohmann::json root;
    root["version"] = kSnapshotVersion;

    root["tournaments"] = nlohmann::json::array();
    for (const auto& tournament : contents.tournaments) {
        root["tournaments"].push_back({
            {"id", tournament.id},
            {"name", tournament.name},
            {"start_time", util::FormatUtcTimestamp(tournament.start_time)},
            {"duration_minutes", tournament.duration_minutes},
            {"margin_minutes", tournament.margin_minutes},
        });
    }

    root["courts"] = nlohmann::json::array();
    for (const auto& court : contents.courts) {
        root["courts"].push_back({
            {"id", court.id},
            {"tournament_id", court.tournament_id},
            {"name", court.name},
        });
    }

    root["stages"] = nlohmann::json::array();
    for (const auto& stage : contents.stages) {
        root["stages"].push_back({
            {"id", stage.id},
            {"tournament_id", stage.tournament_id},
            {"name", stage.name},
        });
    }

    root["stage_items"] = nlohmann::json::array();
    for (const auto& item : contents.stage_items) {
        root["stage_items"].push_back({
            {"id", item.id},
            {"stage_id", item.stage_id},
            {"name", item.name},
            {"type", model::StageTypeToString(item.type)},
            {"team_count", item.team_count},
        });
    }

    root["inputs"] = nlohmann::json::array();
    for (const auto& input : contents.inputs) {
        root["inputs"].push_back({
            {"id", input.id},
            {"stage_item_id", input.stage_item_id},
            {"slot", input.slot},
            {"kind", InputKindToString(input.kind)},
            {"team_id", input.team_id},
            {"winner_from_stage_item_id", input.winner_from_stage_item_id},
            {"winner_position", input.winner_position},
        });
    }

    root["rounds"] = nlohmann::json::array();
    for (const auto& round : contents.rounds) {
        root["rounds"].push_back({
            {"id", round.id},
            {"stage_item_id", round.stage_item_id},
            {"name", round.name},
            {"is_draft", round.is_draft},
        });
    }

    root["matches"] = nlohmann::json::array();
    for (const auto& match : contents.matches) {
        root["matches"].push_back({
            {"id", match.id},
            {"round_id", match.round_id},
            {"input1", WriteSide(match.input1)},
            {"input2", WriteSide(match.input2)},
            {"score1", match.score1},
            {"score2", match.score2},
            {"court_id", Nullable(match.court_id)},
            {"start_time", WriteTime(match.start_time)},
            {"position_in_schedule", Nullable(match.position_in_schedule)},
            {"custom_duration_minutes", Nullable(match.custom_duration_minutes)},
            {"custom_margin_minutes", Nullable(match.custom_margin_minutes)},
        });
    }

    return root.dump(2);
}

bool SnapshotFromJsonString(const std::string& payload, store::InMemoryStore::Contents& contents, std::string* error) {
    try {
        const auto root = nlohmann::json::parse(payload);
        return Decode(root, contents, error);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse snapshot: ") + ex.what();
        }
        return false;
    }
}

bool SaveSnapshot(const std::string& path, const store::InMemoryStore& store, std::string* error) {
    return util::AtomicFileWriter::Write(path, SnapshotToJsonString(store.Export()), error);
}

bool LoadSnapshot(const std::string& path, store::InMemoryStore& store, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open snapshot: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    store::InMemoryStore::Contents contents;
    if (!SnapshotFromJsonString(buffer.str(), contents, error)) {
        return false;
    }
    return store.Import(contents, error);
}

}  // namespace bracketeer::core::persist
