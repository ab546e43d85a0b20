#pragma once

#include <filesystem>
#include <string>

namespace utils
{

// File replacement applied on the next boot.
// Windows registers the rename with the session manager (MoveFileEx with MOVEFILE_DELAY_UNTIL_REBOOT).
// Other platforms append to a JSON journal that the application applies at its next start,
// before anything else touches the install directory.
class DeferredRename
{
public:
    static constexpr const char* kJournalFileName = "pending_renames.json";

    explicit DeferredRename(std::filesystem::path journalPath);

    bool schedule(const std::filesystem::path& source, const std::filesystem::path& target, std::string& outError);

    // Apply and clear journaled renames. Returns the number applied; failed entries stay journaled.
    int applyPending();

    bool hasPending() const;

    // True while a scheduled rename still reads its source from inside directory.
    // On Windows this consults the session manager's PendingFileRenameOperations.
    bool hasPendingFrom(const std::filesystem::path& directory) const;

    const std::filesystem::path& journalPath() const { return journalPath_; }

    static bool IsNativelySupported();

private:
    std::filesystem::path journalPath_;
};

} // namespace utils
