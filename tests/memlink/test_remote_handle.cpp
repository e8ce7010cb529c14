#include <catch2/catch_test_macros.hpp>
#include "mock_channel.hpp"

#include <string>
#include <vector>

using namespace memlink;
using test_utils::CreateHandle;
using test_utils::MockChannel;
using test_utils::MockTarget;

TEST_CASE("RemoteHandle - Session creation", "[handle]") {
    auto target = std::make_shared<MockTarget>();

    SECTION("Successful handshake captures the module table") {
        auto handle = RemoteHandle::Create(std::make_unique<MockChannel>(target));
        REQUIRE(handle.Ok());
        REQUIRE((*handle)->Pid() == MockTarget::kPid);
        REQUIRE((*handle)->ChannelVersion() == 7);
        REQUIRE((*handle)->Modules().client.base_address == MockTarget::kClientBase);
        REQUIRE((*handle)->Modules().engine.base_address == MockTarget::kEngineBase);
        REQUIRE((*handle)->Modules().schema_system.base_address == MockTarget::kSchemaBase);
    }

    SECTION("Protection toggle is issued exactly once") {
        auto handle = RemoteHandle::Create(std::make_unique<MockChannel>(target));
        REQUIRE(handle.Ok());
        REQUIRE(target->initialize_requests == 1);
        REQUIRE(target->protection_requests == 1);
        REQUIRE(target->module_info_requests == 1);
    }

    SECTION("Missing channel is rejected") {
        auto handle = RemoteHandle::Create(nullptr);
        REQUIRE(handle.Kind() == ErrorKind::InvalidArgument);
    }

    SECTION("Failed handshake aborts before the toggle") {
        target->fail_initialize = true;
        auto handle = RemoteHandle::Create(std::make_unique<MockChannel>(target));
        REQUIRE(handle.Kind() == ErrorKind::ChannelFailure);
        REQUIRE(target->protection_requests == 0);
    }

    SECTION("Rejected toggle aborts before the module query") {
        target->reject_protection = true;
        auto handle = RemoteHandle::Create(std::make_unique<MockChannel>(target));
        REQUIRE(handle.Kind() == ErrorKind::ChannelFailure);
        REQUIRE(target->module_info_requests == 0);
    }

    SECTION("Unsuccessful module info names the response kind") {
        target->module_kind = ResponseModuleInfo::Kind::UnknownModule;
        auto handle = RemoteHandle::Create(std::make_unique<MockChannel>(target));
        REQUIRE(handle.Kind() == ErrorKind::ChannelFailure);
        REQUIRE(handle.GetStatus().message.find("unknown module") != std::string::npos);
    }

    SECTION("ProtectProcess re-issues the toggle") {
        auto handle = CreateHandle(target);
        REQUIRE(handle->ProtectProcess().Ok());
        REQUIRE(target->protection_requests == 1);

        target->reject_protection = true;
        REQUIRE(handle->ProtectProcess().kind == ErrorKind::ChannelFailure);
    }
}

TEST_CASE("RemoteHandle - Typed reads", "[handle]") {
    auto target = std::make_shared<MockTarget>();
    auto handle = CreateHandle(target);

    SECTION("Single offset is relative to the module base") {
        target->Write<uint32_t>(MockTarget::kClientBase + 0x40, 0xCAFEBABE);
        auto value = handle->Read<uint32_t>(Module::Client, {0x40});
        REQUIRE(value.Ok());
        REQUIRE(*value == 0xCAFEBABE);
        REQUIRE(target->range_requests == 1);
        REQUIRE(target->chain_requests == 0);
    }

    SECTION("Chain [A, B, C] dereferences A and *(A)+B only") {
        target->Write<uint64_t>(MockTarget::kClientBase + 0x100, MockTarget::kEngineBase);
        target->Write<uint64_t>(MockTarget::kEngineBase + 0x10, MockTarget::kSchemaBase);
        target->Write<int32_t>(MockTarget::kSchemaBase + 0x8, -77);

        auto value = handle->Read<int32_t>(Module::Client, {0x100, 0x10, 0x8});
        REQUIRE(value.Ok());
        REQUIRE(*value == -77);
        REQUIRE(target->chain_requests == 1);
        REQUIRE(target->dereferenced ==
                std::vector<uint64_t>{MockTarget::kClientBase + 0x100, MockTarget::kEngineBase + 0x10});
        REQUIRE(target->read_addresses == std::vector<uint64_t>{MockTarget::kSchemaBase + 0x8});
    }

    SECTION("Absolute reads use the address as is") {
        target->Write<uint16_t>(MockTarget::kEngineBase + 0x2, 0x1234);
        auto value = handle->Read<uint16_t>(Module::Absolute, {MockTarget::kEngineBase + 0x2});
        REQUIRE(value.Ok());
        REQUIRE(*value == 0x1234);
    }

    SECTION("ReadSlice and ReadVec fill consecutive elements") {
        std::vector<uint32_t> values = {1, 2, 3, 4, 5};
        target->WriteBytes(MockTarget::kEngineBase + 0x80, values.data(), values.size() * sizeof(uint32_t));

        uint32_t slice[3] = {};
        REQUIRE(handle->ReadSlice(Module::Engine, {0x84}, slice, 3).Ok());
        REQUIRE(slice[0] == 2);
        REQUIRE(slice[2] == 4);

        auto vec = handle->ReadVec<uint32_t>(Module::Engine, {0x80}, 5);
        REQUIRE(vec.Ok());
        REQUIRE(*vec == values);
    }

    SECTION("Invalid module is reported without a request") {
        auto value = handle->Read<uint32_t>(static_cast<Module>(9), {0x40, 0x8});
        REQUIRE(value.Kind() == ErrorKind::InvalidModule);
        REQUIRE(value.GetStatus().address == std::optional<uint64_t>(0x40));
        REQUIRE(value.GetStatus().message.find("9") != std::string::npos);
        REQUIRE(target->range_requests == 0);
        REQUIRE(target->chain_requests == 0);
    }

    SECTION("Empty chain is rejected") {
        auto value = handle->Read<uint32_t>(Module::Client, {});
        REQUIRE(value.Kind() == ErrorKind::InvalidArgument);
    }

    SECTION("Channel failures surface as ChannelFailure") {
        target->fail_reads = true;
        auto value = handle->Read<uint64_t>(Module::Client, {0x0});
        REQUIRE(value.Kind() == ErrorKind::ChannelFailure);

        auto chained = handle->Read<uint64_t>(Module::Client, {0x0, 0x8});
        REQUIRE(chained.Kind() == ErrorKind::ChannelFailure);
    }

    SECTION("Unmapped memory fails") {
        auto value = handle->Read<uint64_t>(Module::Absolute, {0x9999'0000});
        REQUIRE(value.Kind() == ErrorKind::ChannelFailure);
    }
}

TEST_CASE("RemoteHandle - ReadString", "[handle]") {
    auto target = std::make_shared<MockTarget>();

    SECTION("Short string needs one round trip") {
        auto handle = CreateHandle(target);
        target->WriteString(MockTarget::kClientBase + 0x200, "abc");

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Ok());
        REQUIRE(*text == "abc");
        REQUIRE(target->range_requests == 1);
    }

    SECTION("Longer string grows by eight bytes per round trip") {
        auto handle = CreateHandle(target);
        target->WriteString(MockTarget::kClientBase + 0x200, "twenty characters!!!");

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Ok());
        REQUIRE(*text == "twenty characters!!!");
        REQUIRE(target->range_requests == 3);
    }

    SECTION("Length hint avoids growth") {
        auto handle = CreateHandle(target);
        target->WriteString(MockTarget::kClientBase + 0x200, "twenty characters!!!");

        auto text = handle->ReadString(Module::Client, {0x200}, 32);
        REQUIRE(text.Ok());
        REQUIRE(*text == "twenty characters!!!");
        REQUIRE(target->range_requests == 1);
    }

    SECTION("Empty string") {
        auto handle = CreateHandle(target);
        auto text = handle->ReadString(Module::Client, {0x300});
        REQUIRE(text.Ok());
        REQUIRE(text->empty());
    }

    SECTION("UTF-8 content is kept") {
        auto handle = CreateHandle(target);
        target->WriteString(MockTarget::kClientBase + 0x200, "d\xC3\xA9j\xC3\xA0 vu");

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Ok());
        REQUIRE(*text == "d\xC3\xA9j\xC3\xA0 vu");
    }

    SECTION("Invalid UTF-8 is a decode failure") {
        auto handle = CreateHandle(target);
        target->WriteString(MockTarget::kClientBase + 0x200, "\xFF\xFE");

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Kind() == ErrorKind::DecodeFailure);
    }

    SECTION("Missing terminator stops at the configured cap") {
        SessionOptions options;
        options.max_string_length = 16;
        auto handle = CreateHandle(target, options);

        std::string unterminated(40, 'a');
        target->WriteBytes(MockTarget::kClientBase + 0x200, unterminated.data(), unterminated.size());

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Kind() == ErrorKind::StringTooLong);
        REQUIRE(target->range_requests == 2);
    }

    SECTION("Cap of zero keeps growing") {
        SessionOptions options;
        options.max_string_length = 0;
        auto handle = CreateHandle(target, options);

        std::string long_text(40, 'b');
        target->WriteString(MockTarget::kClientBase + 0x200, long_text.c_str());

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Ok());
        REQUIRE(*text == long_text);
        REQUIRE(target->range_requests == 6);
    }

    SECTION("Read failure carries a read_string prefix") {
        auto handle = CreateHandle(target);
        target->fail_reads = true;

        auto text = handle->ReadString(Module::Client, {0x200});
        REQUIRE(text.Kind() == ErrorKind::ChannelFailure);
        REQUIRE(text.GetStatus().message.rfind("read_string: ", 0) == 0);
    }
}

TEST_CASE("RemoteHandle - Address translation", "[handle]") {
    auto target = std::make_shared<MockTarget>();
    auto handle = CreateHandle(target);

    SECTION("ModuleAddress") {
        auto offset = handle->ModuleAddress(Module::Client, MockTarget::kClientBase + 0x10);
        REQUIRE(offset.has_value());
        REQUIRE(*offset == 0x10);

        REQUIRE_FALSE(handle->ModuleAddress(Module::Client, MockTarget::kEngineBase).has_value());
        REQUIRE(handle->ModuleAddress(Module::Absolute, 0x1234) == std::optional<uint64_t>(0x1234));
    }

    SECTION("MemoryAddress") {
        auto address = handle->MemoryAddress(Module::Engine, 0x10);
        REQUIRE(address.Ok());
        REQUIRE(*address == MockTarget::kEngineBase + 0x10);

        REQUIRE(handle->MemoryAddress(static_cast<Module>(9), 0x10).Kind() == ErrorKind::InvalidModule);
    }
}

TEST_CASE("RemoteHandle - FindPattern", "[handle][pattern]") {
    auto target = std::make_shared<MockTarget>();
    auto handle = CreateHandle(target);

    const uint8_t signature[] = {0x48, 0x8B, 0x05, 0x11, 0x22, 0x33, 0x44, 0xC3};

    SECTION("Hit is returned relative to the module base") {
        target->WriteBytes(MockTarget::kClientBase + 0x345, signature, sizeof(signature));

        auto offset = handle->FindPattern(Module::Client, SearchPattern::FromString("48 8B 05 ?? ?? ?? ?? C3"));
        REQUIRE(offset.Ok());
        REQUIRE(offset->has_value());
        REQUIRE(**offset == 0x345);
    }

    SECTION("Search is limited to the module window") {
        target->WriteBytes(MockTarget::kEngineBase + 0x10, signature, sizeof(signature));

        auto offset = handle->FindPattern(Module::Client, SearchPattern::FromBytes(signature, sizeof(signature)));
        REQUIRE(offset.Ok());
        REQUIRE_FALSE(offset->has_value());
        REQUIRE(target->last_pattern_base == MockTarget::kClientBase);
        REQUIRE(target->last_pattern_length == MockTarget::kModuleSize);

        auto engine = handle->FindPattern(Module::Engine, SearchPattern::FromBytes(signature, sizeof(signature)));
        REQUIRE(engine.Ok());
        REQUIRE(engine->has_value());
        REQUIRE(**engine == 0x10);
    }

    SECTION("Invalid pattern is rejected before the channel") {
        auto offset = handle->FindPattern(Module::Client, SearchPattern::FromString("48 XY"));
        REQUIRE(offset.Kind() == ErrorKind::InvalidArgument);
        REQUIRE(target->pattern_requests == 0);
    }

    SECTION("Invalid module") {
        auto offset = handle->FindPattern(static_cast<Module>(9), SearchPattern::FromString("48"));
        REQUIRE(offset.Kind() == ErrorKind::InvalidModule);
        REQUIRE(offset.GetStatus().message == "invalid module 9");
        REQUIRE(target->pattern_requests == 0);
    }

    SECTION("Channel failure") {
        target->fail_reads = true;
        auto offset = handle->FindPattern(Module::Client, SearchPattern::FromString("48 8B"));
        REQUIRE(offset.Kind() == ErrorKind::ChannelFailure);
    }
}
