#include <catch2/catch_test_macros.hpp>

#include "config/SettingsStore.hpp"
#include "updater/InstallPlan.hpp"
#include "updater/UpdaterService.hpp"
#include "../utils/mock_http.hpp"
#include "../utils/scoped_env.hpp"
#include "../utils/temp_dir.hpp"

#include <picosha2.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace updater;
using test_utils::MockHttpClient;
using test_utils::MockResponses;
using test_utils::TempDir;

namespace fs = std::filesystem;

namespace {

const std::string kApiUrl = "https://api.github.com/repos/sytacxinh/ai-translator/releases/latest";
const std::string kAssetUrl = "https://example.com/CrossTrans_2.0.0.AppImage";
const std::string kPayload(12000, 'P');

struct ServiceFixture {
    TempDir root{ "service" };
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    SettingsStore settings{ root / "config/config.toml" };
    std::vector<std::vector<std::string>> launches;

    ServiceFixture() {
        settings.load();
        test_utils::writeFile(root / "app/CrossTrans.AppImage", "1.0.0");
        test_utils::writeFile(root / "app/crosstrans-installer", "installer");
        test_utils::writeFile(root / "app" / UpdaterService::kPackagedMarker, "");

        http->setResponse(kApiUrl, MockResponses::github_release(
                                       "v2.0.0", "SHA256: " + picosha2::hash256_hex_string(kPayload),
                                       { { "CrossTrans_2.0.0.AppImage", kAssetUrl, kPayload.size() } }));
        http->setResponse(kAssetUrl, MockResponses::binary(kPayload));
    }

    UpdaterOptions options() {
        UpdaterOptions o;
        o.http = http;
        o.installPath = root / "app/CrossTrans.AppImage";
        o.installerPath = root / "app/crosstrans-installer";
        o.markerDir = root / "markers";
        o.downloadRoot = root.path();
        o.sleep = [](std::chrono::milliseconds) {};
        o.assetSuffix = ".AppImage";
        o.launcher = [this](const fs::path&, const std::vector<std::string>& args, const fs::path&) {
            launches.push_back(args);
            return true;
        };
        return o;
    }
};

}  // namespace

TEST_CASE("Updater service drives one update attempt", "[updater][service]") {
    ServiceFixture f;
    UpdaterService service(f.settings, f.options());

    SECTION("Nothing works before initialization") {
        REQUIRE_FALSE(service.isInitialized());
        REQUIRE(service.checkForUpdates().status == CheckResult::Status::CheckFailed);
        REQUIRE_FALSE(service.startDownload());
    }

    service.initialize("sytacxinh", "ai-translator", Version("1.0.0"));
    REQUIRE(service.isInitialized());
    REQUIRE(service.canSelfUpdate());

    SECTION("Check, download and hand off") {
        CheckResult check = service.checkForUpdates();
        REQUIRE(check.status == CheckResult::Status::Available);
        REQUIRE(service.getState() == UpdateState::Available);
        REQUIRE(service.isUpdateAvailable());
        REQUIRE(service.getUpdatePackage().version == Version(2, 0, 0));

        FetchResult fetched = service.downloadUpdate();
        REQUIRE(fetched.success);
        REQUIRE(service.getState() == UpdateState::Downloaded);
        REQUIRE(service.getDownloadProgress().percentage == 100);

        std::string error;
        REQUIRE(service.applyUpdate(error));
        REQUIRE(service.getState() == UpdateState::ExternalRoutineLaunched);
        REQUIRE(f.launches.size() == 1);
        REQUIRE(f.launches[0][0] == "--plan");

        AppSettings s = f.settings.snapshot();
        REQUIRE(s.updateStats.totalChecks == 1);
        REQUIRE(s.updateStats.successfulChecks == 1);
    }

    SECTION("Asynchronous download reports completion") {
        REQUIRE(service.checkForUpdates().status == CheckResult::Status::Available);

        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        FetchResult completed;
        REQUIRE(service.startDownload(nullptr, [&](const FetchResult& result) {
            std::lock_guard<std::mutex> lock(m);
            completed = result;
            done = true;
            cv.notify_one();
        }));

        std::unique_lock<std::mutex> lock(m);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds(10), [&] { return done; }));
        REQUIRE(completed.success);
        REQUIRE(service.getState() == UpdateState::Downloaded);
    }

    SECTION("Download needs an available update") {
        REQUIRE_FALSE(service.startDownload());
        std::string error;
        REQUIRE_FALSE(service.applyUpdate(error));
        REQUIRE(error == "No update ready to apply");
    }

    SECTION("Failed check is recorded by category") {
        f.http->setResponse(kApiUrl, MockResponses::github_not_found());
        CheckResult check = service.checkForUpdates();
        REQUIRE(check.status == CheckResult::Status::CheckFailed);
        REQUIRE(service.getState() == UpdateState::Idle);

        UpdateStats stats = f.settings.snapshot().updateStats;
        REQUIRE(stats.failedChecks == 1);
        REQUIRE(stats.errorCounts["not_found"] == 1);
    }

    SECTION("Up to date") {
        f.http->setResponse(kApiUrl, MockResponses::github_release("v1.0.0", "", {}));
        REQUIRE(service.checkForUpdates().status == CheckResult::Status::NoUpdate);
        REQUIRE_FALSE(service.isUpdateAvailable());
    }

    SECTION("Corrupted download fails the attempt") {
        f.http->setResponse(kAssetUrl, MockResponses::binary(std::string(kPayload.size(), 'X')));
        REQUIRE(service.checkForUpdates().status == CheckResult::Status::Available);
        FetchResult fetched = service.downloadUpdate();
        REQUIRE(fetched.errorKind == FetchErrorKind::ChecksumMismatch);
        REQUIRE(service.getState() == UpdateState::Failed);
        REQUIRE(f.launches.empty());
    }
}

TEST_CASE("Source builds do not self-update", "[updater][service]") {
    ServiceFixture f;
    fs::remove(f.root / "app" / UpdaterService::kPackagedMarker);

    UpdaterService service(f.settings, f.options());
    service.initialize("sytacxinh", "ai-translator", Version("1.0.0"));
    REQUIRE_FALSE(service.canSelfUpdate());
    REQUIRE(service.releasesPageUrl() == "https://github.com/sytacxinh/ai-translator/releases/latest");

    REQUIRE(service.checkForUpdates().status == CheckResult::Status::Available);
    REQUIRE_FALSE(service.startDownload());
    REQUIRE_FALSE(service.downloadUpdate().success);
    REQUIRE(service.getState() == UpdateState::Available);
}

#ifndef _WIN32
TEST_CASE("AppImage installs replace the image file", "[updater][service]") {
    ServiceFixture f;
    fs::path appImage = f.root / "app/CrossTrans.AppImage";
    test_utils::ScopedEnv env("APPIMAGE", appImage.string());

    UpdaterOptions options = f.options();
    options.installPath.clear();
    UpdaterService service(f.settings, options);
    service.initialize("sytacxinh", "ai-translator", Version("1.0.0"));
    REQUIRE(service.canSelfUpdate());

    REQUIRE(service.checkForUpdates().status == CheckResult::Status::Available);
    REQUIRE(service.downloadUpdate().success);
    std::string error;
    REQUIRE(service.applyUpdate(error));

    REQUIRE(f.launches.size() == 1);
    REQUIRE(f.launches[0].size() == 2);
    InstallPlan plan;
    REQUIRE(InstallPlan::loadFromFile(f.launches[0][1], plan, error));
    REQUIRE(fs::path(plan.installPath) == appImage);
    REQUIRE(plan.backupPath == appImage.string() + ".bak");
}
#endif
