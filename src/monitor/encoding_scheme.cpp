#include <iostream>
#include <sstream>
#include <vector>
#include <functional>

#include "encoding_scheme.hpp"
#include "test_utils.hpp"

namespace Schemes
{
    namespace
    {
        struct NeededShardsVisitor
        {
            uint32_t operator()(const Replication &) const { return 1; }
            uint32_t operator()(const ReedSolomon &rs) const { return rs.k; }
            uint32_t operator()(const XorParity &xp) const { return xp.data; }
        };

        struct DeclaredShardsVisitor
        {
            uint32_t operator()(const Replication &r) const { return r.factor; }
            uint32_t operator()(const ReedSolomon &rs) const { return rs.k + rs.m; }
            uint32_t operator()(const XorParity &xp) const { return xp.data + xp.parity; }
        };

        struct DescribeVisitor
        {
            std::string operator()(const Replication &r) const
            {
                return "replication(factor=" + std::to_string(r.factor) + ")";
            }
            std::string operator()(const ReedSolomon &rs) const
            {
                return "reed-solomon(k=" + std::to_string(rs.k) + ", m=" + std::to_string(rs.m) + ")";
            }
            std::string operator()(const XorParity &xp) const
            {
                return "xor-parity(data=" + std::to_string(xp.data) + ", parity=" + std::to_string(xp.parity) + ")";
            }
        };

        struct ValidateVisitor
        {
            std::optional<std::string> operator()(const Replication &r) const
            {
                if (r.factor < 1)
                    return std::string("replication factor must be at least 1");
                return std::nullopt;
            }
            std::optional<std::string> operator()(const ReedSolomon &rs) const
            {
                if (rs.k < 1)
                    return std::string("reed-solomon k must be at least 1");
                return std::nullopt;
            }
            std::optional<std::string> operator()(const XorParity &xp) const
            {
                if (xp.data < 1)
                    return std::string("xor-parity data count must be at least 1");
                return std::nullopt;
            }
        };
    }

    uint32_t neededShards(const EncodingScheme &scheme)
    {
        return std::visit(NeededShardsVisitor{}, scheme);
    }

    uint32_t declaredShards(const EncodingScheme &scheme)
    {
        return std::visit(DeclaredShardsVisitor{}, scheme);
    }

    uint32_t toleratedFailures(const EncodingScheme &scheme)
    {
        return declaredShards(scheme) - neededShards(scheme);
    }

    std::string algorithmName(const EncodingScheme &scheme)
    {
        if (std::holds_alternative<Replication>(scheme))
            return "replication";
        if (std::holds_alternative<ReedSolomon>(scheme))
            return "reed-solomon";
        return "xor-parity";
    }

    std::string describe(const EncodingScheme &scheme)
    {
        return std::visit(DescribeVisitor{}, scheme);
    }

    std::optional<std::string> validate(const EncodingScheme &scheme)
    {
        return std::visit(ValidateVisitor{}, scheme);
    }
}

////////////////////////////////////////////
// EncodingScheme tests
////////////////////////////////////////////
namespace EncodingSchemeTests
{
    void testNeededShards()
    {
        ASSERT_THAT(Schemes::neededShards(Replication{3}) == 1);
        ASSERT_THAT(Schemes::neededShards(ReedSolomon{4, 2}) == 4);
        ASSERT_THAT(Schemes::neededShards(XorParity{2, 1}) == 2);

        ASSERT_THAT(Schemes::declaredShards(Replication{3}) == 3);
        ASSERT_THAT(Schemes::declaredShards(ReedSolomon{4, 2}) == 6);
        ASSERT_THAT(Schemes::declaredShards(XorParity{2, 1}) == 3);
    }

    void testToleratedFailures()
    {
        ASSERT_THAT(Schemes::toleratedFailures(Replication{3}) == 2);
        ASSERT_THAT(Schemes::toleratedFailures(ReedSolomon{3, 2}) == 2);
        ASSERT_THAT(Schemes::toleratedFailures(ReedSolomon{5, 0}) == 0);
        ASSERT_THAT(Schemes::toleratedFailures(XorParity{4, 1}) == 1);

        ASSERT_THAT(Schemes::algorithmName(ReedSolomon{3, 2}) == "reed-solomon");
        ASSERT_THAT(Schemes::describe(ReedSolomon{4, 2}) == "reed-solomon(k=4, m=2)");
    }

    void testValidate()
    {
        ASSERT_THAT(!Schemes::validate(ReedSolomon{1, 0}).has_value());
        ASSERT_THAT(Schemes::validate(ReedSolomon{0, 2}).has_value());
        ASSERT_THAT(Schemes::validate(Replication{0}).has_value());
        ASSERT_THAT(Schemes::validate(XorParity{0, 1}).has_value());
        ASSERT_THAT(!Schemes::validate(XorParity{2, 1}).has_value());
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "EncodingScheme Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testNeededShards),
            TEST(testToleratedFailures),
            TEST(testValidate)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
