#include "../include/config_utils.h"
#include "../include/constants.h"
#include "../include/time_utils.h"
#include "../include/errors.h"

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <string>

static bool isTimezoneOffset(std::string_view tz) {
    if (tz.size() != 5 || (tz[0] != '+' && tz[0] != '-')) {
        return false;
    }
    for (size_t i = 1; i < tz.size(); ++i) {
        if (tz[i] < '0' || tz[i] > '9') return false;
    }
    return true;
}

Identity identityFromEnvironment(const char* nameVar, const char* emailVar, const char* dateVar) {
    Identity identity;

    const char* name = std::getenv(nameVar);
    identity.name = (name && *name) ? name : std::string(constants::AUTHOR_NAME);

    const char* email = std::getenv(emailVar);
    identity.email = (email && *email) ? email : std::string(constants::AUTHOR_EMAIL);

    const char* date = std::getenv(dateVar);
    if (!date || !*date) {
        std::time_t now = std::time(nullptr);
        identity.timestamp = now;
        identity.timezone = localTimezoneOffset(now);
        return identity;
    }

    // "<seconds> <+|-HHMM>"
    const std::string_view value(date);
    const size_t spacePos = value.find(' ');
    const std::string_view seconds = value.substr(0, spacePos);
    auto [ptr, ec] = std::from_chars(seconds.data(), seconds.data() + seconds.size(), identity.timestamp);
    if (spacePos == std::string_view::npos || ec != std::errc{} || ptr != seconds.data() + seconds.size() ||
        !isTimezoneOffset(value.substr(spacePos + 1))) {
        throw GitError(std::string("invalid date in ") + dateVar + ": '" + date + "'");
    }
    identity.timezone = std::string(value.substr(spacePos + 1));
    return identity;
}

Identity authorIdentity() {
    return identityFromEnvironment("GIT_AUTHOR_NAME", "GIT_AUTHOR_EMAIL", "GIT_AUTHOR_DATE");
}

Identity committerIdentity() {
    return identityFromEnvironment("GIT_COMMITTER_NAME", "GIT_COMMITTER_EMAIL", "GIT_COMMITTER_DATE");
}

std::optional<std::filesystem::path> findGitDir(const std::filesystem::path& start) {
    std::filesystem::path current = std::filesystem::absolute(start);
    while (true) {
        const auto candidate = current / constants::GIT_DIR_NAME;
        std::error_code ec;
        if (std::filesystem::is_directory(candidate, ec)) {
            return candidate;
        }
        if (!current.has_parent_path() || current.parent_path() == current) {
            return std::nullopt;
        }
        current = current.parent_path();
    }
}

std::filesystem::path requireGitDir() {
    auto gitDir = findGitDir(std::filesystem::current_path());
    if (!gitDir) {
        throw GitError("not a git repository (or any of the parent directories): " +
                       std::string(constants::GIT_DIR_NAME));
    }
    return *gitDir;
}
