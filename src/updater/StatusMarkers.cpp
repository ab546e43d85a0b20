#include "StatusMarkers.hpp"

#include <plog/Log.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

std::string Trim(const std::string& value)
{
    const char* ws = " \t\r\n";
    auto begin = value.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1);
}

std::optional<Version> ParseVersion(const std::string& content)
{
    Version v;
    if (!Version::tryParse(Trim(content), v))
        return std::nullopt;
    return v;
}

} // namespace

StatusMarkers::StatusMarkers(fs::path directory)
    : directory_(std::move(directory))
{
}

fs::path StatusMarkers::DefaultDirectory()
{
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec)
    {
        PLOG_WARNING << "No system temp directory, markers go to the working directory: " << ec.message();
        return fs::current_path(ec);
    }
    return dir;
}

bool StatusMarkers::writeAtomic(const char* name, const std::string& content, std::string& outError)
{
    std::error_code ec;
    fs::create_directories(directory_, ec);

    fs::path target = directory_ / name;
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            outError = "Failed to open marker file " + tmp.string();
            PLOG_ERROR << outError;
            return false;
        }
        out << content;
        out.flush();
        if (!out)
        {
            outError = "Failed to write marker file " + tmp.string();
            PLOG_ERROR << outError;
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        outError = "Failed to publish marker " + target.string() + ": " + ec.message();
        PLOG_ERROR << outError;
        fs::remove(tmp, ec);
        return false;
    }

    PLOG_INFO << "Wrote status marker " << name;
    return true;
}

bool StatusMarkers::writeSuccess(const Version& version, std::string& outError)
{
    return writeAtomic(kSuccessFile, version.toString() + "\n", outError);
}

// Line 1: numeric code, remaining lines: message
bool StatusMarkers::writeError(const std::string& message, int code, std::string& outError)
{
    return writeAtomic(kErrorFile, std::to_string(code) + "\n" + message + "\n", outError);
}

bool StatusMarkers::writeExpectedVersion(const Version& version, std::string& outError)
{
    return writeAtomic(kExpectedFile, version.toString() + "\n", outError);
}

bool StatusMarkers::writePendingInstaller(const std::string& installerPath, std::string& outError)
{
    return writeAtomic(kPendingFile, installerPath + "\n", outError);
}

std::optional<std::string> StatusMarkers::take(const char* name)
{
    fs::path path = directory_ / name;
    std::error_code ec;
    if (!fs::exists(path, ec))
        return std::nullopt;

    std::string content;
    {
        std::ifstream in(path, std::ios::binary);
        if (in.is_open())
        {
            std::ostringstream ss;
            ss << in.rdbuf();
            content = ss.str();
        }
    }

    fs::remove(path, ec);
    if (ec)
    {
        // Leaving it would replay the same outcome on every start
        PLOG_ERROR << "Failed to delete marker " << path.string() << ": " << ec.message();
    }
    PLOG_INFO << "Consumed status marker " << name;
    return content;
}

MarkerSnapshot StatusMarkers::consumeAll()
{
    MarkerSnapshot snapshot;

    if (auto content = take(kSuccessFile))
    {
        snapshot.success = ParseVersion(*content);
        if (!snapshot.success)
            PLOG_WARNING << "Ignoring malformed success marker: '" << Trim(*content) << "'";
    }

    if (auto content = take(kErrorFile))
    {
        std::istringstream in(*content);
        std::string codeLine;
        std::getline(in, codeLine);
        try
        {
            size_t consumed = 0;
            int code = std::stoi(Trim(codeLine), &consumed);
            if (consumed != Trim(codeLine).size())
                throw std::invalid_argument("trailing characters");

            std::string rest((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            snapshot.error = ErrorMarker{ Trim(rest), code };
        }
        catch (const std::exception&)
        {
            PLOG_WARNING << "Ignoring malformed error marker";
        }
    }

    if (auto content = take(kExpectedFile))
    {
        snapshot.expectedVersion = ParseVersion(*content);
        if (!snapshot.expectedVersion)
            PLOG_WARNING << "Ignoring malformed expected-version marker";
    }

    if (auto content = take(kPendingFile))
    {
        std::string path = Trim(*content);
        if (!path.empty())
            snapshot.pendingInstallerPath = path;
        else
            PLOG_WARNING << "Ignoring empty pending-installer marker";
    }

    return snapshot;
}

bool StatusMarkers::hasAny() const
{
    std::error_code ec;
    for (const char* name : { kSuccessFile, kErrorFile, kExpectedFile, kPendingFile })
    {
        if (fs::exists(directory_ / name, ec))
            return true;
    }
    return false;
}

void StatusMarkers::clear()
{
    std::error_code ec;
    for (const char* name : { kSuccessFile, kErrorFile, kExpectedFile, kPendingFile })
    {
        fs::remove(directory_ / name, ec);
    }
}

} // namespace updater
