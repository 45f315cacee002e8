//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/FileUtils.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class FileUtilsSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        auto const optWorkspace = FileUtils::CreateTemporaryFolder("chainkit-utilities-test");
        ASSERT_TRUE(optWorkspace);
        m_workspace = *optWorkspace;
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(m_workspace, error);
    }

    std::filesystem::path m_workspace;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FileUtilsSuite, TemporaryFoldersAreDistinctTest)
{
    auto const optOther = FileUtils::CreateTemporaryFolder("chainkit-utilities-test");
    ASSERT_TRUE(optOther);
    EXPECT_NE(*optOther, m_workspace);
    EXPECT_TRUE(std::filesystem::is_directory(*optOther));
    EXPECT_TRUE(std::filesystem::is_empty(*optOther));

    std::error_code error;
    std::filesystem::remove_all(*optOther, error);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FileUtilsSuite, CreateNestedFolderTest)
{
    auto const nested = m_workspace / "a" / "b" / "c";
    EXPECT_TRUE(FileUtils::CreateFolderIfNoneExist(nested));
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_TRUE(FileUtils::CreateFolderIfNoneExist(nested));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FileUtilsSuite, WriteAndReadFileTest)
{
    std::vector<std::uint8_t> const data{ 0x00, 0x01, 0x02, 0xFE, 0xFF };
    auto const path = m_workspace / "data.bin";

    EXPECT_TRUE(FileUtils::WriteFile(path, data));
    auto const optRead = FileUtils::ReadFile(path);
    ASSERT_TRUE(optRead);
    EXPECT_EQ(*optRead, data);

    EXPECT_FALSE(FileUtils::ReadFile(m_workspace / "missing.bin"));
    EXPECT_FALSE(FileUtils::WriteFile(m_workspace / "missing" / "data.bin", data));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FileUtilsSuite, WriteStreamTest)
{
    // The stream spans several transfer chunks. 
    std::string const content(FileUtils::TransferChunkSize * 2 + 17, 'x');
    std::istringstream stream{ content };

    auto const path = m_workspace / "image.tar";
    EXPECT_TRUE(FileUtils::WriteStream(path, stream));

    auto const optRead = FileUtils::ReadFile(path);
    ASSERT_TRUE(optRead);
    EXPECT_EQ(std::string(optRead->begin(), optRead->end()), content);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FileUtilsSuite, LinkOrCopyTest)
{
    auto const source = m_workspace / "source.txt";
    auto const destination = m_workspace / "destination.txt";
    ASSERT_TRUE(FileUtils::WriteFile(source, { 'a', 'b', 'c' }));

    EXPECT_TRUE(FileUtils::LinkOrCopy(source, destination));
    auto const optRead = FileUtils::ReadFile(destination);
    ASSERT_TRUE(optRead);
    EXPECT_EQ(optRead->size(), std::size_t{ 3 });

    // Existing destinations are never replaced. 
    EXPECT_FALSE(FileUtils::LinkOrCopy(source, destination));
    EXPECT_FALSE(FileUtils::LinkOrCopy(m_workspace / "missing.txt", m_workspace / "other.txt"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PrettyPrinterSuite, FormatTest)
{
    boost::json::object json;
    json["version"] = "0.1.0";
    json["discovery"] = boost::json::object{ { "port", 4001 }, { "bootstraps", boost::json::array{} } };
    json["flags"] = boost::json::array{ true, nullptr };

    std::ostringstream oss;
    JSON::PrettyPrinter{ 2 }.Format(json, oss);

    std::string const expected = 
        "{\n"
        "  \"version\": \"0.1.0\",\n"
        "  \"discovery\": {\n"
        "    \"port\": 4001,\n"
        "    \"bootstraps\": []\n"
        "  },\n"
        "  \"flags\": [\n"
        "    true,\n"
        "    null\n"
        "  ]\n"
        "}\n";
    EXPECT_EQ(oss.str(), expected);

    // The formatted document remains valid JSON. 
    boost::json::error_code error;
    auto const parsed = boost::json::parse(oss.str(), error);
    EXPECT_FALSE(error);
    EXPECT_EQ(parsed, boost::json::value{ json });
}

//----------------------------------------------------------------------------------------------------------------------
