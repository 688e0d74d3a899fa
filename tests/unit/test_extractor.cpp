#include <gtest/gtest.h>
#include <codeloop/agent/extractor.hpp>

namespace codeloop {
namespace {

// ============================================================================
// Labeled variant (planner)
// ============================================================================

TEST(ExtractLabeledBlock, TakesPythonFenceAfterPlan) {
    std::string reply =
        "Plan:\nAdd the numbers and print.\n\n"
        "```python\nprint(2+2)\n```\n";
    EXPECT_EQ(extract_labeled_block(reply), "print(2+2)");
}

TEST(ExtractLabeledBlock, PrefersLabeledFenceOverEarlierUnlabeledOne) {
    std::string reply =
        "Example output:\n```\n4\n```\n"
        "Code:\n```python\nprint(2+2)\n```\n";
    EXPECT_EQ(extract_labeled_block(reply), "print(2+2)");
}

TEST(ExtractLabeledBlock, LabelIsCaseInsensitive) {
    EXPECT_EQ(extract_labeled_block("```Python\nx = 1\nprint(x)\n```"), "x = 1\nprint(x)");
    EXPECT_EQ(extract_labeled_block("```PY\nprint(1)\n```"), "print(1)");
    EXPECT_EQ(extract_labeled_block("```python3\nprint(1)\n```"), "print(1)");
}

TEST(ExtractLabeledBlock, TrailingProseIsIgnored) {
    std::string reply = "```python\nprint(2+2)\n```\nThis prints 4.";
    EXPECT_EQ(extract_labeled_block(reply), "print(2+2)");
}

TEST(ExtractLabeledBlock, FallsBackToFirstCompleteFence) {
    std::string reply = "Plan: sum\n```\nprint(sum([1, 2]))\n```\n```js\nconsole.log(3)\n```";
    EXPECT_EQ(extract_labeled_block(reply), "print(sum([1, 2]))");
}

TEST(ExtractLabeledBlock, DropsWholeInfoStringOfLabeledFence) {
    EXPECT_EQ(extract_labeled_block("```python title=\"x\"\nprint(1)\n```"), "print(1)");
    EXPECT_EQ(extract_labeled_block("Plan:\n```python {linenos=true}\nx = 2\nprint(x)\n```"),
              "x = 2\nprint(x)");
}

TEST(ExtractLabeledBlock, UnclosedFenceYieldsEmpty) {
    EXPECT_EQ(extract_labeled_block("Plan:\n```python\nprint(1)\n"), "");
}

TEST(ExtractLabeledBlock, NoFenceYieldsEmpty) {
    EXPECT_EQ(extract_labeled_block("print(2+2)"), "");
    EXPECT_EQ(extract_labeled_block(""), "");
}

TEST(ExtractLabeledBlock, EmptyFenceYieldsEmpty) {
    EXPECT_EQ(extract_labeled_block("```python\n```"), "");
    EXPECT_EQ(extract_labeled_block("``````"), "");
}

TEST(ExtractLabeledBlock, ReextractionIsStable) {
    const char* replies[] = {
        "Plan:\nloop\n```python\nfor i in range(3):\n    print(i)\n```",
        "```py\n\n  x = [1, 2]\nprint(len(x))  \n\n```",
        "```\nprint('a')\n```",
    };
    for (const char* reply : replies) {
        std::string once = extract_labeled_block(reply);
        std::string twice = extract_labeled_block("```python\n" + once + "\n```");
        EXPECT_EQ(once, twice) << "reply: " << reply;
    }
}

// ============================================================================
// First-fence variant (fixer)
// ============================================================================

TEST(ExtractFirstBlock, TakesFirstFenceWithoutLabelCheck) {
    std::string reply = "```\nprint('fixed')\n```\n```python\nprint('other')\n```";
    EXPECT_EQ(extract_first_block(reply), "print('fixed')");
}

TEST(ExtractFirstBlock, StripsLanguageTag) {
    EXPECT_EQ(extract_first_block("Here:\n```python\nprint(1)\n```"), "print(1)");
}

TEST(ExtractFirstBlock, DropsWholeInfoStringOfLabeledFence) {
    EXPECT_EQ(extract_first_block("```python3 main.py\nprint(1)\n```"), "print(1)");
    EXPECT_EQ(extract_first_block("```\nprint('no info')\n```"), "print('no info')");
}

TEST(ExtractFirstBlock, AcceptsUnclosedFence) {
    EXPECT_EQ(extract_first_block("```python\nprint(1)\n"), "print(1)");
}

TEST(ExtractFirstBlock, NoFenceYieldsEmpty) {
    EXPECT_EQ(extract_first_block("I could not fix it."), "");
}

TEST(ExtractFirstBlock, DiffersFromLabeledVariantOnPurpose) {
    std::string reply = "```text\nexpected: 4\n```\n```python\nprint(4)\n```";
    EXPECT_EQ(extract_first_block(reply), "text\nexpected: 4");
    EXPECT_EQ(extract_labeled_block(reply), "print(4)");
}

// ============================================================================
// Normalization helpers
// ============================================================================

TEST(StripLanguageTag, OnlyBareTagLineIsRemoved) {
    EXPECT_EQ(strip_language_tag("python\nprint(1)"), "print(1)");
    EXPECT_EQ(strip_language_tag("  py  \n\n  print(1)\n"), "print(1)");
    EXPECT_EQ(strip_language_tag("python print(1)"), "python print(1)");
    EXPECT_EQ(strip_language_tag("pythonic = 1"), "pythonic = 1");
    EXPECT_EQ(strip_language_tag("python"), "");
}

TEST(ExtractNarrative, ReturnsProseBeforeFirstFence) {
    EXPECT_EQ(extract_narrative("Plan:\nsum it\n\n```python\nprint(1)\n```"), "Plan:\nsum it");
    EXPECT_EQ(extract_narrative("just words"), "just words");
    EXPECT_EQ(extract_narrative("```python\nprint(1)\n```"), "```python\nprint(1)\n```");
}

// ============================================================================
// Auto-instrumentation
// ============================================================================

TEST(AutoInstrument, WrapsSingleExpression) {
    EXPECT_EQ(auto_instrument("2+2"), "print(2+2)");
    EXPECT_EQ(auto_instrument("\n\n  sum(range(10))  \n"), "print(sum(range(10)))");
}

TEST(AutoInstrument, LeavesCodeWithPrintAlone) {
    EXPECT_EQ(auto_instrument("print(2+2)"), "print(2+2)");
    EXPECT_EQ(auto_instrument("x = 3\nprint(x)"), "x = 3\nprint(x)");
}

TEST(AutoInstrument, LeavesMultiLineCodeAlone) {
    std::string code = "x = 2\nx * 2";
    EXPECT_FALSE(needs_instrumentation(code));
    EXPECT_EQ(auto_instrument(code), code);
}

TEST(AutoInstrument, LeavesDeclarationsAlone) {
    EXPECT_EQ(auto_instrument("import math"), "import math");
    EXPECT_EQ(auto_instrument("from math import pi"), "from math import pi");
    EXPECT_EQ(auto_instrument("def f(): return 1"), "def f(): return 1");
    EXPECT_EQ(auto_instrument("class A: pass"), "class A: pass");
}

TEST(AutoInstrument, EmptyStaysEmpty) {
    EXPECT_FALSE(needs_instrumentation(""));
    EXPECT_EQ(auto_instrument("   \n "), "");
}

TEST(AutoInstrument, IsIdempotent) {
    const char* inputs[] = { "2+2", "print(1)", "import os", "a = 1\nb = 2", "" };
    for (const char* in : inputs) {
        std::string once = auto_instrument(in);
        EXPECT_EQ(auto_instrument(once), once) << "input: " << in;
    }
}

} // namespace
} // namespace codeloop
