#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include <nlohmann/json.hpp>

#include <filesystem>

class GameCore;

// Cards of hidden stacks are not listed, only counted
nlohmann::ordered_json buildSnapshotJSON(const GameCore& core);
bool outputSnapshotToJSON(const GameCore& core, const std::filesystem::path& filePath);

#endif // OUTPUT_HPP
