#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fenrom {

/**
 * @brief Named store of move record artifacts
 *
 * The emitter writes one artifact per move; the ROM assembler lists them in
 * byte order of their names to recover puzzle groups.
 */
class RecordSink
{
public:
    virtual ~RecordSink() = default;

    virtual void write(const std::string& name, const std::string& content) = 0;
    virtual void remove(const std::string& name) = 0;
    virtual std::string read(const std::string& name) const = 0;

    // Artifact names, sorted by byte value.
    virtual std::vector<std::string> list() const = 0;
};

// One ".txt" file per artifact inside a directory.
class DirectorySink : public RecordSink
{
    std::filesystem::path directory;

public:
    explicit DirectorySink(std::filesystem::path dir) : directory(std::move(dir)) {}

    // Creates the directory; with clean set, removes artifacts left by an earlier run.
    void prepare(bool clean);

    const std::filesystem::path& path() const { return directory; }

    void write(const std::string& name, const std::string& content) override;
    void remove(const std::string& name) override;
    std::string read(const std::string& name) const override;
    std::vector<std::string> list() const override;
};

// In-process sink, used for dry runs and tests.
class MemorySink : public RecordSink
{
    std::map<std::string, std::string> artifacts;

public:
    void write(const std::string& name, const std::string& content) override;
    void remove(const std::string& name) override;
    std::string read(const std::string& name) const override;
    std::vector<std::string> list() const override;

    size_t size() const { return artifacts.size(); }
    bool contains(const std::string& name) const { return artifacts.count(name) != 0; }
};

} // namespace fenrom
