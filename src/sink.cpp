#include "sink.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace fenrom {

namespace {

constexpr const char* RECORD_EXTENSION = ".txt";

bool isRecordFile(const fs::directory_entry& entry)
{
    return entry.is_regular_file() && entry.path().extension() == RECORD_EXTENSION;
}

} // namespace

void DirectorySink::prepare(bool clean)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw IoError("Could not create directory " + directory.string() + ": " + ec.message());
    }
    if (!clean) return;

    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw IoError("Could not read directory " + directory.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!isRecordFile(entry)) continue;
        fs::remove(entry.path(), ec);
        if (ec) {
            throw IoError("Could not remove " + entry.path().string() + ": " + ec.message());
        }
    }
}

void DirectorySink::write(const std::string& name, const std::string& content)
{
    const fs::path file = directory / name;
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IoError("Could not open file for writing: " + file.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw IoError("Could not write file: " + file.string());
    }
}

void DirectorySink::remove(const std::string& name)
{
    const fs::path file = directory / name;
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        throw IoError("Could not remove " + file.string() + ": " + ec.message());
    }
}

std::string DirectorySink::read(const std::string& name) const
{
    const fs::path file = directory / name;
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("Could not open file: " + file.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> DirectorySink::list() const
{
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw IoError("Could not read directory " + directory.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (isRecordFile(entry)) {
            names.push_back(entry.path().filename().string());
        }
    }
    // std::string compares bytes, which keeps ids differing only in case apart
    std::sort(names.begin(), names.end());
    return names;
}

void MemorySink::write(const std::string& name, const std::string& content)
{
    artifacts[name] = content;
}

void MemorySink::remove(const std::string& name)
{
    artifacts.erase(name);
}

std::string MemorySink::read(const std::string& name) const
{
    auto it = artifacts.find(name);
    if (it == artifacts.end()) {
        throw IoError("No such record: " + name);
    }
    return it->second;
}

std::vector<std::string> MemorySink::list() const
{
    std::vector<std::string> names;
    names.reserve(artifacts.size());
    for (const auto& [name, content] : artifacts) {
        names.push_back(name);
    }
    return names;
}

} // namespace fenrom
