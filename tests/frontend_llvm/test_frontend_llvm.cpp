/**
 * @file test_frontend_llvm.cpp
 * @brief LLVM textual IR mapped onto CIR modules
 */

#include "frontend_llvm/frontend.hpp"

#include "capslock/common.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace capslock::frontend_llvm::test {

namespace {

constexpr const char* kSampleModule = R"(; ModuleID = 'app'
source_filename = "src/app.c"

@handler_slot = global i32 (i32)* @double_it

declare i8* @open_file(i8*)

declare void @_ZN4core3ptr13drop_in_place17h0123456789abcdefE(i8*)

define i32 @double_it(i32 %x) {
entry:
  %r = mul i32 %x, 2
  ret i32 %r
}

define i32 @negate(i32 %x) {
entry:
  %r = sub i32 0, %x
  ret i32 %r
}

define i32 @run(i8* %path) {
entry:
  %h = call i8* @open_file(i8* %path)
  %f = load i32 (i32)*, i32 (i32)** @handler_slot
  %a = call i32 %f(i32 1)
  %b = call i32 %f(i32 2), !callees !0
  call void @_ZN4core3ptr13drop_in_place17h0123456789abcdefE(i8* %h)
  %s = add i32 %a, %b
  ret i32 %s
}

define internal void @spin() {
entry:
  call void asm sideeffect "nop", ""()
  ret void
}

!0 = !{i32 (i32)* @double_it, i32 (i32)* @negate}
)";

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(ensure_temp_dir(name))
    {}

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

std::filesystem::path write_text_file(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
    return path;
}

const ir::Function* find_function(const ir::Module& module, const std::string& symbol)
{
    auto it = std::ranges::find(module.functions, symbol, &ir::Function::symbol);
    return it == module.functions.end() ? nullptr : &*it;
}

}  // namespace

TEST(FrontendLlvmTest, MapsFunctionsAndFlags)
{
    TempDir temp_dir("capslock_frontend_llvm_flags");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm().load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const ir::Module& module = *loaded;

    EXPECT_EQ(module.module_id, "app.ll");
    EXPECT_EQ(module.unit, "app");
    EXPECT_EQ(module.source_path, "src/app.c");
    EXPECT_TRUE(module.input_digest.starts_with("sha256:"));
    EXPECT_EQ(module.functions.size(), 6U);

    const auto* run = find_function(module, "run");
    ASSERT_NE(run, nullptr);
    EXPECT_FALSE(run->external);
    EXPECT_TRUE(run->entry);
    EXPECT_EQ(run->unit, "app");
    EXPECT_EQ(run->signature.return_type, "i32");
    EXPECT_EQ(run->signature.params, std::vector<std::string>{"i8*"});

    const auto* open_file = find_function(module, "open_file");
    ASSERT_NE(open_file, nullptr);
    EXPECT_TRUE(open_file->external);
    EXPECT_FALSE(open_file->entry);

    const auto* spin = find_function(module, "spin");
    ASSERT_NE(spin, nullptr);
    EXPECT_FALSE(spin->external);
    EXPECT_FALSE(spin->entry);
}

TEST(FrontendLlvmTest, CallSitesKeepInstructionPositions)
{
    TempDir temp_dir("capslock_frontend_llvm_calls");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm().load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto* run = find_function(*loaded, "run");
    ASSERT_NE(run, nullptr);
    ASSERT_EQ(run->calls.size(), 4U);

    EXPECT_EQ(run->calls[0].id, "B0.I0");
    EXPECT_EQ(run->calls[0].kind, ir::CallKind::kDirect);
    EXPECT_EQ(run->calls[0].callee, "open_file");

    EXPECT_EQ(run->calls[1].id, "B0.I2");
    EXPECT_EQ(run->calls[1].kind, ir::CallKind::kIndirect);
    EXPECT_EQ(run->calls[1].signature.key(), "fn(i32)->i32");
    EXPECT_FALSE(run->calls[1].candidates.has_value());

    EXPECT_EQ(run->calls[2].id, "B0.I3");
    ASSERT_TRUE(run->calls[2].candidates.has_value());
    EXPECT_EQ(*run->calls[2].candidates, (std::vector<std::string>{"double_it", "negate"}));

    EXPECT_EQ(run->calls[3].id, "B0.I4");
    EXPECT_EQ(run->calls[3].callee, "_ZN4core3ptr13drop_in_place17h0123456789abcdefE");
    EXPECT_TRUE(run->gaps.empty());
}

TEST(FrontendLlvmTest, DemangledDeclarationsCarryTheirUnit)
{
    TempDir temp_dir("capslock_frontend_llvm_units");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm().load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto* drop = find_function(*loaded, "_ZN4core3ptr13drop_in_place17h0123456789abcdefE");
    ASSERT_NE(drop, nullptr);
    EXPECT_EQ(drop->display_name, "core::ptr::drop_in_place");
    EXPECT_EQ(drop->unit, "core");
}

TEST(FrontendLlvmTest, GlobalsRecordFunctionReferences)
{
    TempDir temp_dir("capslock_frontend_llvm_globals");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm().load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    ASSERT_EQ(loaded->globals.size(), 1U);
    EXPECT_EQ(loaded->globals[0].symbol, "handler_slot");
    EXPECT_EQ(loaded->globals[0].refs, std::vector<std::string>{"double_it"});
}

TEST(FrontendLlvmTest, InlineAssemblyIsAGap)
{
    TempDir temp_dir("capslock_frontend_llvm_asm");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm().load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto* spin = find_function(*loaded, "spin");
    ASSERT_NE(spin, nullptr);
    EXPECT_TRUE(spin->calls.empty());
    ASSERT_EQ(spin->gaps.size(), 1U);
    EXPECT_EQ(spin->gaps[0].site_id, "B0.I0");
    EXPECT_EQ(spin->gaps[0].code, error_code::kUnsupportedConstruct);
}

TEST(FrontendLlvmTest, StrictModeRejectsInlineAssembly)
{
    TempDir temp_dir("capslock_frontend_llvm_strict");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm(FrontendOptions{.strict = true, .unit = {}}).load(path);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, error_code::kUnsupportedConstruct);
    EXPECT_NE(loaded.error().message.find("spin"), std::string::npos);
}

TEST(FrontendLlvmTest, UnitOverride)
{
    TempDir temp_dir("capslock_frontend_llvm_override");
    auto path = write_text_file(temp_dir.path() / "app.ll", kSampleModule);

    auto loaded = FrontendLlvm(FrontendOptions{.strict = false, .unit = "my_crate"}).load(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded->unit, "my_crate");
    const auto* run = find_function(*loaded, "run");
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->unit, "my_crate");
}

TEST(FrontendLlvmTest, UnreadableInputIsMalformed)
{
    TempDir temp_dir("capslock_frontend_llvm_bad");
    auto garbage = write_text_file(temp_dir.path() / "bad.ll", "define this is not IR\n");

    auto parsed = FrontendLlvm().load(garbage);
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, error_code::kMalformedInput);

    auto missing = FrontendLlvm().load(temp_dir.path() / "missing.ll");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, error_code::kMalformedInput);
}

TEST(FrontendLlvmTest, DemangleSymbol)
{
    EXPECT_EQ(demangle_symbol("_ZN4core3ptr13drop_in_place17h0123456789abcdefE"),
              "core::ptr::drop_in_place");
    EXPECT_EQ(demangle_symbol("_ZN3foo3barEv"), "foo::bar()");
    EXPECT_EQ(demangle_symbol("plain_c_symbol"), "plain_c_symbol");
}

TEST(FrontendLlvmTest, UnitFromDisplayName)
{
    EXPECT_EQ(unit_from_display_name("core::ptr::drop_in_place", "x"), "core");
    EXPECT_EQ(unit_from_display_name("<alloc::vec::Vec<T> as Drop>::drop", "x"), "alloc");
    EXPECT_EQ(unit_from_display_name("<dyn std::io::Write>::flush", "x"), "std");
    EXPECT_EQ(unit_from_display_name("open_file", "app"), "app");
    EXPECT_EQ(unit_from_display_name("::leading", "app"), "app");
}

}  // namespace capslock::frontend_llvm::test
