/**
 * @file SourceScanner.cpp
 * @brief Implementation of the SourceScanner.
 */

#include "infrastructure/SourceScanner.hpp"
#include "infrastructure/ContentHasher.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace archmend::infrastructure {

SourceScanner::SourceScanner(const std::string& rootPath)
    : m_rootPath(rootPath) {}

std::vector<domain::SourceUnit> SourceScanner::scan() const {
    std::error_code ec;
    if (!fs::is_directory(m_rootPath, ec)) {
        throw std::invalid_argument("Source directory does not exist: " + m_rootPath);
    }

    std::vector<domain::SourceUnit> units;
    for (fs::recursive_directory_iterator it(m_rootPath, fs::directory_options::skip_permission_denied, ec), end;
         it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[SourceScanner] Skipping entry: " << ec.message() << std::endl;
            ec.clear();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;

        if (ClassifyByExtension(it->path().extension().string()) == domain::ContentType::Unknown) {
            continue;
        }

        try {
            units.push_back(load(it->path().string()));
        } catch (const std::exception& e) {
            std::cerr << "[SourceScanner] " << e.what() << std::endl;
        }
    }

    std::sort(units.begin(), units.end(), [](const domain::SourceUnit& a, const domain::SourceUnit& b) {
        return a.id < b.id;
    });
    return units;
}

domain::SourceUnit SourceScanner::load(const std::string& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + filePath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    domain::SourceUnit unit;
    unit.path = filePath;
    unit.id = fs::path(filePath).lexically_relative(m_rootPath).generic_string();
    if (unit.id.empty() || unit.id.rfind("..", 0) == 0) {
        unit.id = fs::path(filePath).filename().generic_string();
    }
    unit.text = buffer.str();
    unit.contentHash = ContentHasher::Sha256Hex(unit.text);
    unit.type = ClassifyByExtension(fs::path(filePath).extension().string());
    return unit;
}

domain::ContentType SourceScanner::ClassifyByExtension(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    if (ext == ".java") return domain::ContentType::Java;
    if (ext == ".md") return domain::ContentType::Markdown;
    if (ext == ".txt") return domain::ContentType::PlainText;
    return domain::ContentType::Unknown;
}

} // namespace archmend::infrastructure
