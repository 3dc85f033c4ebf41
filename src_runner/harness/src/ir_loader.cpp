#include "babel_testing/ir_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace babel::testing {

IrDocument IrLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("IR file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("IR path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open IR file: " + file.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Malformed JSON in " + file.string() + ": " + ex.what());
    }
    return parse(document, file.string());
}

std::vector<IrDocument> IrLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw std::runtime_error("IR path does not exist: " + root.string());
    }
    if (!std::filesystem::is_directory(root)) {
        return {load(root)};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.emplace_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<IrDocument> documents;
    documents.reserve(files.size());
    for (const auto& file : files) {
        documents.push_back(load(file));
    }
    return documents;
}

IrDocument IrLoader::parse(const json& document, const std::string& origin) const {
    try {
        return document.get<IrDocument>();
    } catch (const json::exception& ex) {
        throw std::runtime_error("Invalid IR in " + origin + ": " + ex.what());
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error("Invalid IR in " + origin + ": " + ex.what());
    }
}

}  // namespace babel::testing
