// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================

#include "openhtml/output.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace openhtml::output::test {

// ==============================================================================
// Форматирование сообщений
// ==============================================================================

TEST(OutputTest, FormatInfo_ContainsPrefix) {
    EXPECT_EQ(format_info("Searching"), "[+] Searching\n");
}

TEST(OutputTest, FormatError_ContainsPrefix) {
    EXPECT_EQ(format_error("Directory '/x' not found"), "[x] Directory '/x' not found\n");
}

TEST(OutputTest, FormatDebug_ContainsPrefix) {
    EXPECT_EQ(format_debug("detail"), "[*] detail\n");
}

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
    EXPECT_EQ(ansi_reset_code(), "\x1b[0m");
}

// ==============================================================================
// Writer: уровни и quiet
// ==============================================================================
// Захват gtest подменяет fd на файл, поэтому TTY нет и ANSI кодов тоже.

TEST(OutputTest, Info_WrittenToStderr) {
    OutputConfig cfg;
    Writer writer(cfg);

    ::testing::internal::CaptureStderr();
    writer.info("hello");
    writer.flush();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[+] hello\n");
}

TEST(OutputTest, Quiet_SuppressesInfoButNotErrors) {
    OutputConfig cfg;
    cfg.quiet = true;
    Writer writer(cfg);

    ::testing::internal::CaptureStderr();
    writer.info("hidden");
    writer.green_line_stderr("--- hidden ---");
    writer.error("shown");
    writer.flush();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[x] shown\n");
}

TEST(OutputTest, DebugAndTrace_DependOnVerbosity) {
    OutputConfig cfg;
    cfg.verbose = 1;
    Writer writer(cfg);

    ::testing::internal::CaptureStderr();
    writer.debug("dbg");
    writer.trace("trc");
    writer.flush();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[*] dbg"), std::string::npos);
    EXPECT_EQ(err.find("trc"), std::string::npos);
}

TEST(OutputTest, Trace_ShownAtDoubleVerbose) {
    OutputConfig cfg;
    cfg.verbose = 2;
    Writer writer(cfg);

    ::testing::internal::CaptureStderr();
    writer.debug("dbg");
    writer.trace("trc");
    writer.flush();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[*] dbg"), std::string::npos);
    EXPECT_NE(err.find("[~] trc"), std::string::npos);
    EXPECT_EQ(err.find("[!]"), std::string::npos);
}

TEST(OutputTest, WriteLine_GoesToStdout) {
    OutputConfig cfg;
    Writer writer(cfg);

    ::testing::internal::CaptureStdout();
    writer.write_line(Stream::Stdout, "file:///a.html");
    writer.flush();
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "file:///a.html\n");
}

// ==============================================================================
// JSON
// ==============================================================================

TEST(OutputTest, WriteJsonPretty_ProducesParsableJson) {
    rapidjson::Document doc;
    doc.SetArray();
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("name", "a.html", doc.GetAllocator());
    doc.PushBack(obj, doc.GetAllocator());

    OutputConfig cfg;
    Writer writer(cfg);

    ::testing::internal::CaptureStdout();
    writer.write_json_pretty(doc);
    std::string out = ::testing::internal::GetCapturedStdout();

    rapidjson::Document parsed;
    parsed.Parse(out.c_str());
    ASSERT_FALSE(parsed.HasParseError());
    ASSERT_TRUE(parsed.IsArray());
    ASSERT_EQ(parsed.Size(), 1u);
    EXPECT_STREQ(parsed[0]["name"].GetString(), "a.html");
    EXPECT_EQ(out.back(), '\n');
}

}  // namespace openhtml::output::test
