#include <cpprest/json.h>
#include <cpprest/base_uri.h>

#include <iostream>
#include <string>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

#include "utils.hpp"
#include "test_utils.hpp"

using namespace web;

namespace ApiUtils {
    /**
     * Builds a relative request path from the given segments, percent-encoding 
     * each segment.
     */
    std::string buildPath(const std::vector<std::string> &segments)
    {
        std::string path;
        for (const auto &segment : segments)
            path += "/" + uri::encode_data_string(segment);
        return path.empty() ? "/" : path;
    }

    /**
     * Extracts the human-readable error detail from a service error body.
     */
    std::string errorDetail(const std::string &body)
    {
        if (body.empty())
            return "";

        try
        {
            json::value parsed = json::value::parse(body);
            if (parsed.is_object() && parsed.has_field(U("detail")))
            {
                const json::value &detail = parsed.at(U("detail"));
                return detail.is_string() ? detail.as_string() : detail.serialize();
            }
        }
        catch (const json::json_exception &)
        {
            // not JSON - surface the body as-is
        }
        return body;
    }

    int64_t intField(const json::value &obj, const std::string &key, int64_t fallback)
    {
        if (!obj.is_object() || !obj.has_field(key))
            return fallback;

        const json::value &v = obj.at(key);
        if (!v.is_number())
            return fallback;
        return v.as_number().is_integral() ? v.as_number().to_int64() : static_cast<int64_t>(v.as_double());
    }

    double doubleField(const json::value &obj, const std::string &key, double fallback)
    {
        if (!obj.is_object() || !obj.has_field(key))
            return fallback;

        const json::value &v = obj.at(key);
        return v.is_number() ? v.as_double() : fallback;
    }

    std::string stringField(const json::value &obj, const std::string &key, const std::string &fallback)
    {
        if (!obj.is_object() || !obj.has_field(key))
            return fallback;

        const json::value &v = obj.at(key);
        return v.is_string() ? v.as_string() : fallback;
    }

    bool boolField(const json::value &obj, const std::string &key, bool fallback)
    {
        if (!obj.is_object() || !obj.has_field(key))
            return fallback;

        const json::value &v = obj.at(key);
        return v.is_boolean() ? v.as_bool() : fallback;
    }
};

namespace PrintUtils {

    /**
     * Pads `text` such that it sits in the center of a 
     * new text string of width `width`.
     */
    std::string centerText(std::string text, int width) 
    {
        size_t size = text.size(); 

        if (size > static_cast<size_t>(width)) 
            return text.substr(0, width);

        int padding = (width - size) / 2;
        int extra = (width - size) % 2; // handle odd padding
        return std::string(padding, ' ') + text + std::string(padding + extra, ' ');
    }

    /**
     * Returns compact string representation of the number of
     * bytes `bytes`, using traditional suffixes KB/MB/GB/TB etc.
     */
    std::string formatNumBytes(uint64_t bytes)
    {
        const char* suffixes[] = {"bytes", "KB", "MB", "GB", "TB", "PB"};
        int suffixIndex = 0;
        double size = static_cast<double>(bytes);

        while (size >= 1024 && suffixIndex < 5)
        {
            size /= 1024;
            suffixIndex++;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << size << " " << suffixes[suffixIndex];
        return oss.str();
    }

    std::string formatPercent(double percent)
    {
        int precision = 1;
        if (percent < 0.1)
            precision = 3;
        else if (percent < 1.0)
            precision = 2;

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << percent << "%";
        return oss.str();
    }

    std::string tableDivider(int numColumns, int columnWidth, bool inner)
    {
        std::string divider(columnWidth, '-');
        std::ostringstream oss;

        for (int i = 0; i < numColumns; i++)
        {
            if (inner)
            {
                oss << "|" << divider;
                if (i == numColumns - 1)
                    oss << "|";
            }
            else
            {
                oss << divider << "-";
                if (i == numColumns - 1)
                    oss << "-";
            }
        }
        oss << "\n";
        return oss.str();
    }

    std::string tableRow(const std::vector<std::string> &cells, int columnWidth)
    {
        std::ostringstream oss;
        for (const auto &cell : cells)
            oss << "|" << centerText(cell, columnWidth);
        oss << "|" << "\n";
        return oss.str();
    }
}

namespace StringUtils
{
    std::vector<std::string> splitWords(const std::string &str)
    {
        std::istringstream iss(str);
        std::vector<std::string> words;
        std::string word;
        while (iss >> word)
            words.push_back(word);
        return words;
    }

    std::string toLower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }
}

////////////////////////////////////////////
// Utils tests
////////////////////////////////////////////
namespace UtilsTests
{
    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "Utils Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testBuildPath),
            TEST(testErrorDetail),
            TEST(testOptionalFields),
            TEST(testFormatting)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }

    void testBuildPath()
    {
        ASSERT_THAT(ApiUtils::buildPath({"nodes", "status"}) == "/nodes/status");
        ASSERT_THAT(ApiUtils::buildPath({"file", "abc-123", "reconstruct-info"}) == "/file/abc-123/reconstruct-info");
        ASSERT_THAT(ApiUtils::buildPath({"nodes", "node 1", "restore"}) == "/nodes/node%201/restore");
        ASSERT_THAT(ApiUtils::buildPath({}) == "/");
    }

    void testErrorDetail()
    {
        ASSERT_THAT(ApiUtils::errorDetail("{\"detail\": \"File abc not found\"}") == "File abc not found");
        ASSERT_THAT(ApiUtils::errorDetail("Internal Server Error") == "Internal Server Error");
        ASSERT_THAT(ApiUtils::errorDetail("{\"message\": \"x\"}") == "{\"message\": \"x\"}");
        ASSERT_THAT(ApiUtils::errorDetail("").empty());
    }

    void testOptionalFields()
    {
        json::value obj = json::value::parse(
            "{\"size\": 42, \"cost\": 1.67, \"name\": \"a\", \"flag\": true, \"nothing\": null, \"half\": 2.5}");

        ASSERT_THAT(ApiUtils::intField(obj, "size", 0) == 42);
        ASSERT_THAT(ApiUtils::intField(obj, "half", 0) == 2);
        ASSERT_THAT(ApiUtils::intField(obj, "nothing", 7) == 7);
        ASSERT_THAT(ApiUtils::intField(obj, "missing", 7) == 7);
        ASSERT_THAT(ApiUtils::intField(obj, "name", 7) == 7);

        ASSERT_THAT(ApiUtils::doubleField(obj, "cost", 0.0) == 1.67);
        ASSERT_THAT(ApiUtils::doubleField(obj, "size", 0.0) == 42.0);
        ASSERT_THAT(ApiUtils::stringField(obj, "name", "") == "a");
        ASSERT_THAT(ApiUtils::stringField(obj, "size", "none") == "none");
        ASSERT_THAT(ApiUtils::boolField(obj, "flag", false));
        ASSERT_THAT(!ApiUtils::boolField(obj, "missing", false));

        json::value notAnObject = json::value::number(3);
        ASSERT_THAT(ApiUtils::intField(notAnObject, "size", 9) == 9);
    }

    void testFormatting()
    {
        ASSERT_THAT(PrintUtils::centerText("ab", 6) == "  ab  ");
        ASSERT_THAT(PrintUtils::centerText("abc", 6) == " abc  ");
        ASSERT_THAT(PrintUtils::centerText("abcdefgh", 4) == "abcd");

        ASSERT_THAT(PrintUtils::formatNumBytes(512) == "512.00 bytes");
        ASSERT_THAT(PrintUtils::formatNumBytes(1536) == "1.50 KB");
        ASSERT_THAT(PrintUtils::formatNumBytes(50ull * 1024 * 1024 * 1024) == "50.00 GB");

        ASSERT_THAT(PrintUtils::formatPercent(0.0123) == "0.012%");
        ASSERT_THAT(PrintUtils::formatPercent(0.57) == "0.57%");
        ASSERT_THAT(PrintUtils::formatPercent(42.31) == "42.3%");

        ASSERT_THAT(StringUtils::splitWords("  fail   node-1 ") == std::vector<std::string>({"fail", "node-1"}));
        ASSERT_THAT(StringUtils::toLower("Reed-Solomon") == "reed-solomon");
    }
};
