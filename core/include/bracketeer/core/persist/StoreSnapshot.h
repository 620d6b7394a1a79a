#pragma once

#include "bracketeer/core/store/InMemoryStore.h"

#include <string>

namespace bracketeer::core::persist {

constexpr int kSnapshotVersion = 1;

std::string SnapshotToJsonString(const store::InMemoryStore::Contents& contents);
bool SnapshotFromJsonString(const std::string& payload, store::InMemoryStore::Contents& contents, std::string* error);

bool SaveSnapshot(const std::string& path, const store::InMemoryStore& store, std::string* error);
// Replaces the store's contents only when the whole file decodes.
bool LoadSnapshot(const std::string& path, store::InMemoryStore& store, std::string* error);

}  // namespace bracketeer::core::persist
