#include "io/MemoryStore.hpp"

#include <utility>

using namespace stepwise::io;

MemoryStore::MemoryStore(std::string name) : name_(std::move(name)) {}

std::optional<nlohmann::json> MemoryStore::load() { return record_; }

void MemoryStore::save(const nlohmann::json& record) { record_ = record; }

void MemoryStore::clean() { record_.reset(); }

std::string MemoryStore::location() const { return "memory:" + name_; }
