#include <gtest/gtest.h>

#include <sys/wait.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "zip_fixture.hpp"

namespace fs = std::filesystem;

namespace {

struct RunResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string quoted(const std::string& arg) {
    std::string result = "'";
    for (const char c : arg) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    return result + "'";
}

std::string body_paragraph() {
    return "Kommentare mit Beleidigungen werden ausgeblendet und die Person wird freundlich, "
           "aber bestimmt auf die Regeln der Community hingewiesen.";
}

// Runs one of the tools from a scratch directory, capturing both streams.
class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string{"taktkb_cli_"} + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    RunResult run(const std::string& tool, const std::vector<std::string>& args) const {
        std::string command = quoted(tool);
        for (const auto& arg : args) {
            command += ' ' + quoted(arg);
        }
        const fs::path out = dir_ / "stdout.log";
        const fs::path err = dir_ / "stderr.log";
        command += " >" + quoted(out.string()) + " 2>" + quoted(err.string());

        RunResult result;
        const int status = std::system(command.c_str());
        if (status != -1 && WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        result.out = read_file(out);
        result.err = read_file(err);
        return result;
    }

    fs::path write_text(const std::string& name, const std::string& content) const {
        const fs::path path = dir_ / name;
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    fs::path dir_;
};

}  // namespace

TEST_F(CliTest, BuildKnowledgeRejectsSinglePair) {
    const auto doc = write_text("regelwerk.txt", "TEIL A\n" + body_paragraph() + "\n");
    const fs::path out = dir_ / "knowledge.json";

    const auto result = run(TAKTKB_BUILD_KNOWLEDGE_BIN, {doc.string(), "regelwerk", out.string()});

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("Usage: build_knowledge"), std::string::npos);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(CliTest, BuildKnowledgeRejectsOddArgumentCount) {
    const auto doc = write_text("regelwerk.txt", body_paragraph());

    EXPECT_EQ(run(TAKTKB_BUILD_KNOWLEDGE_BIN, {}).exit_code, 1);
    const auto result =
        run(TAKTKB_BUILD_KNOWLEDGE_BIN, {doc.string(), "regelwerk", doc.string(), "out.json"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("Usage: build_knowledge"), std::string::npos);
}

TEST_F(CliTest, BuildKnowledgeWritesKnowledgeBase) {
    const auto regelwerk = write_text("regelwerk.txt", "TEIL A\n" + body_paragraph() + "\n");
    const auto brandvoice =
        write_text("brandvoice.txt", "=== TON UND STIL ===\n" + body_paragraph() + "\n");
    const fs::path out = dir_ / "knowledge.json";

    const auto result = run(TAKTKB_BUILD_KNOWLEDGE_BIN, {regelwerk.string(), "regelwerk",
                                                        brandvoice.string(), "brandvoice",
                                                        out.string()});

    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_NE(result.out.find("OK: wrote " + out.string() + " with 2 chunks"),
              std::string::npos);

    const auto json = nlohmann::ordered_json::parse(read_file(out));
    EXPECT_EQ(json["chunk_count"].get<int>(), 2);
    EXPECT_EQ(json["chunks"][0]["source"].get<std::string>(), "regelwerk");
    EXPECT_EQ(json["chunks"][0]["title"].get<std::string>(), "TEIL A");
    EXPECT_EQ(json["chunks"][1]["title"].get<std::string>(), "TON UND STIL");
    EXPECT_EQ(json["df"]["regeln"].get<int>(), 2);
}

TEST_F(CliTest, BuildKnowledgeLeavesNoOutputOnUnreadableDocument) {
    const auto good = write_text("regelwerk.txt", "TEIL A\n" + body_paragraph() + "\n");
    const auto broken = write_text("kaputt.docx", "this is not a zip archive");
    const fs::path out = dir_ / "knowledge.json";

    const auto result = run(TAKTKB_BUILD_KNOWLEDGE_BIN, {good.string(), "regelwerk",
                                                        broken.string(), "kaputt", out.string()});

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("fatal error:"), std::string::npos);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(CliTest, DocxToTextRejectsWrongArgumentCount) {
    const auto result = run(TAKTKB_DOCX_TO_TEXT_BIN, {dir_.string()});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_NE(result.err.find("Usage: docx_to_text"), std::string::npos);

    EXPECT_EQ(run(TAKTKB_DOCX_TO_TEXT_BIN, {"a", "b", "c"}).exit_code, 2);
}

TEST_F(CliTest, DocxToTextReportsEmptyInputDirectory) {
    const fs::path input = dir_ / "input";
    const fs::path output = dir_ / "output";
    fs::create_directories(input);
    write_text("input/notes.txt", "kein Word-Dokument");

    const auto result = run(TAKTKB_DOCX_TO_TEXT_BIN, {input.string(), output.string()});

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("No .docx files found in " + input.string()), std::string::npos);
    EXPECT_TRUE(fs::is_directory(output));
    EXPECT_TRUE(fs::is_empty(output));
}

TEST_F(CliTest, DocxToTextWritesOneFilePerDocument) {
    const fs::path input = dir_ / "input";
    const fs::path output = dir_ / "output";
    fs::create_directories(input);
    const std::string xml = taktkb::fixtures::word_document(
        "<w:p><w:r><w:t>EINLEITUNG</w:t></w:r></w:p>"
        "<w:p><w:r><w:t>Willkommen im Team.</w:t></w:r></w:p>");
    write_text("input/Brand Voice.docx",
               taktkb::fixtures::build_zip({{"word/document.xml", xml, true}}));

    const auto result = run(TAKTKB_DOCX_TO_TEXT_BIN, {input.string(), output.string()});

    ASSERT_EQ(result.exit_code, 0) << result.err;
    const fs::path written = output / "Brand_Voice.txt";
    EXPECT_NE(result.out.find("Wrote " + written.string()), std::string::npos);
    EXPECT_EQ(read_file(written), "=== EINLEITUNG ===\n\nWillkommen im Team.\n");
}
