// ==============================================================================
// test_launcher_gtest.cpp - Тесты Launcher (GoogleTest)
// ==============================================================================

#include "openhtml/launcher.hpp"
#include "openhtml/output.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace openhtml::launch::test {

// ==============================================================================
// Вспомогательные типы
// ==============================================================================

/// Запоминает запросы вместо вызова ОС
class RecordingOpener : public Opener {
public:
    explicit RecordingOpener(bool succeed = true) : succeed_(succeed) {}

    bool open_new_tab(const std::string& uri) override {
        uris.push_back(uri);
        return succeed_;
    }

    std::vector<std::string> uris;

private:
    bool succeed_;
};

io::CandidateFile candidate(const std::filesystem::path& dir, const std::string& name) {
    io::CandidateFile file;
    file.name = name;
    file.absolute_path = dir / name;
    file.uri = io::make_file_uri(file.absolute_path);
    return file;
}

std::filesystem::path sample_dir() {
    return std::filesystem::temp_directory_path() / "openhtml_launcher";
}

// ==============================================================================
// Launcher
// ==============================================================================

TEST(LauncherTest, OneRequestPerFile_InReceivedOrder) {
    output::OutputConfig cfg;
    cfg.quiet = true;
    output::Writer writer(cfg);
    RecordingOpener opener;

    std::vector<io::CandidateFile> files = {candidate(sample_dir(), "z.html"),
                                            candidate(sample_dir(), "a.HTML"),
                                            candidate(sample_dir(), "m.html")};

    Launcher launcher(opener, writer);
    LaunchReport report = launcher.launch_all(files);

    EXPECT_EQ(report.requested, 3u);
    EXPECT_EQ(report.failed, 0u);
    ASSERT_EQ(opener.uris.size(), 3u);
    for (std::size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(opener.uris[i], files[i].uri);
        EXPECT_EQ(opener.uris[i].rfind("file://", 0), 0u);
        EXPECT_TRUE(std::filesystem::path(opener.uris[i].substr(7)).is_absolute());
    }
}

TEST(LauncherTest, NoFiles_NoRequests) {
    output::OutputConfig cfg;
    cfg.quiet = true;
    output::Writer writer(cfg);
    RecordingOpener opener;

    Launcher launcher(opener, writer);
    LaunchReport report = launcher.launch_all({});

    EXPECT_EQ(report.requested, 0u);
    EXPECT_TRUE(opener.uris.empty());
}

TEST(LauncherTest, HandlerFailure_IsCountedNotThrown) {
    output::OutputConfig cfg;
    cfg.quiet = true;
    output::Writer writer(cfg);
    RecordingOpener opener(false);

    std::vector<io::CandidateFile> files = {candidate(sample_dir(), "a.html"),
                                            candidate(sample_dir(), "b.html")};

    Launcher launcher(opener, writer);
    LaunchReport report;
    EXPECT_NO_THROW(report = launcher.launch_all(files));

    EXPECT_EQ(report.requested, 2u);
    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(opener.uris.size(), 2u);
}

TEST(LauncherTest, LogsEachFileName) {
    output::OutputConfig cfg;
    output::Writer writer(cfg);
    RecordingOpener opener;

    std::vector<io::CandidateFile> files = {candidate(sample_dir(), "first.html"),
                                            candidate(sample_dir(), "second.html")};

    ::testing::internal::CaptureStderr();
    Launcher launcher(opener, writer);
    launcher.launch_all(files);
    writer.flush();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("-> Opening: first.html"), std::string::npos);
    EXPECT_NE(err.find("-> Opening: second.html"), std::string::npos);
    EXPECT_LT(err.find("first.html"), err.find("second.html"));
}

}  // namespace openhtml::launch::test
