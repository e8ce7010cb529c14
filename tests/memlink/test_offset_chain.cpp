#include <catch2/catch_test_macros.hpp>
#include "memlink/channel/OffsetChain.hpp"

#include <map>
#include <vector>

using namespace memlink;

TEST_CASE("ResolveOffsetChain - Walks pointers", "[chain]") {
    std::map<uint64_t, uint64_t> pointers = {
        {0x1000, 0x2000},
        {0x2010, 0x3000},
    };
    std::vector<uint64_t> visited;

    auto reader = [&](uint64_t address, uint64_t& value) {
        visited.push_back(address);
        auto it = pointers.find(address);
        if (it == pointers.end())
            return false;
        value = it->second;
        return true;
    };

    SECTION("Single element resolves without reading") {
        OffsetChain chain = {0x1234};
        auto result = ResolveOffsetChain(chain.data(), chain.size(), reader);
        REQUIRE(result.Ok());
        REQUIRE(*result == 0x1234);
        REQUIRE(visited.empty());
    }

    SECTION("Last element is only added") {
        OffsetChain chain = {0x1000, 0x10, 0x8};
        auto result = ResolveOffsetChain(chain.data(), chain.size(), reader);
        REQUIRE(result.Ok());
        REQUIRE(*result == 0x3008);
        REQUIRE(visited == std::vector<uint64_t>{0x1000, 0x2010});
    }

    SECTION("Unreadable link reports its address") {
        OffsetChain chain = {0x1000, 0x20, 0x8};
        auto result = ResolveOffsetChain(chain.data(), chain.size(), reader);
        REQUIRE_FALSE(result.Ok());
        REQUIRE(result.Kind() == ErrorKind::ChannelFailure);
        REQUIRE(result.GetStatus().address.has_value());
        REQUIRE(*result.GetStatus().address == 0x2020);
    }

    SECTION("Empty chain is rejected") {
        auto result = ResolveOffsetChain(nullptr, 0, reader);
        REQUIRE(result.Kind() == ErrorKind::InvalidArgument);
        REQUIRE(visited.empty());
    }
}
