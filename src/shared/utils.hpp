#pragma once

#include <cpprest/json.h>

#include <iostream>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <unordered_set>
#include <sstream>

using namespace web;

namespace ApiUtils {

    /**
     * Builds a relative request path from the given segments, percent-encoding 
     * each segment.
     * 
     * E.g.
     * 
     * {"file", "a b", "status"} -> "/file/a%20b/status"
     */
    std::string buildPath(const std::vector<std::string> &segments);

    /**
     * Extracts the human-readable error detail from a service error body.
     * 
     * E.g.
     * 
     * {"detail": "File abc not found"} -> "File abc not found"
     * 
     * Falls back to the raw body when it isn't JSON or carries no detail.
     */
    std::string errorDetail(const std::string &body);

    /**
     * Reads an optional integer field, returning `fallback` if `key` is 
     * missing, null or not a number.
     */
    int64_t intField(const json::value &obj, const std::string &key, int64_t fallback);

    /**
     * Reads an optional floating point field, returning `fallback` if `key` 
     * is missing, null or not a number.
     */
    double doubleField(const json::value &obj, const std::string &key, double fallback);

    /**
     * Reads an optional string field, returning `fallback` if `key` is 
     * missing, null or not a string.
     */
    std::string stringField(const json::value &obj, const std::string &key, const std::string &fallback);

    /**
     * Reads an optional boolean field, returning `fallback` if `key` is 
     * missing, null or not a boolean.
     */
    bool boolField(const json::value &obj, const std::string &key, bool fallback);
};
    
namespace PrintUtils {

    /**
     * Joins the elements of `vec` with ", ".
     */
    template<typename T>
    std::string joinVector(const std::vector<T>& vec) 
    {
        std::ostringstream oss;
        for (size_t i = 0; i < vec.size(); ++i) 
        {
            oss << vec[i];
            if (i != vec.size() - 1)
                oss << ", ";
        }
        return oss.str();
    }

    /**
     * Pads `text` such that it sits in the center of a 
     * new text string of width `width`.
     */
    std::string centerText(std::string text, int width);

    /**
     * Returns compact string representation of the number of
     * bytes `bytes`, using traditional suffixes KB/MB/GB/TB etc.
     */
    std::string formatNumBytes(uint64_t bytes);

    /**
     * Returns `percent` with precision that grows as the value shrinks,
     * so that small utilisation values don't round to 0.
     * 
     * e.g. 0.0123 => "0.012%", 0.57 => "0.57%", 42.31 => "42.3%"
     */
    std::string formatPercent(double percent);

    /**
     * Returns a table divider line for `numColumns` columns of width `columnWidth`.
     * 
     * `inner` selects the '|'-separated divider drawn under the header row.
     */
    std::string tableDivider(int numColumns, int columnWidth, bool inner = false);

    /**
     * Returns a table row, with each cell centered in a column 
     * of width `columnWidth`.
     */
    std::string tableRow(const std::vector<std::string> &cells, int columnWidth);
};

namespace StringUtils
{
    /**
     * Splits `str` on whitespace, dropping empty tokens.
     */
    std::vector<std::string> splitWords(const std::string &str);

    /**
     * Returns lower-case copy of `str`.
     */
    std::string toLower(std::string str);
}

////////////////////////////////////////////
// Utils tests
////////////////////////////////////////////
namespace UtilsTests
{
    void testBuildPath();
    void testErrorDetail();
    void testOptionalFields();
    void testFormatting();
    void runAll();
}
