#include "pyspot/core/block_segmenter.hpp"
#include <gtest/gtest.h>

namespace pyspot {

class BlockSegmenterTest : public ::testing::Test {
protected:
    LineClassifier classifier_{std::make_shared<const KeywordTables>(KeywordTables::python())};
    BlockSegmenter segmenter_{classifier_};
};

TEST_F(BlockSegmenterTest, BlankAndIndentedLinesContinueBlock)
{
    std::vector<std::string> lines = {
        "Some prose here\n",
        "import os\n",
        "\n",
        "    x = 1\n",
        "more prose\n",
        "print(x)\n"
    };

    auto blocks = segmenter_.form_code_blocks(lines);

    std::vector<LineRange> expected = {{.start = 1, .end = 3}, {.start = 5, .end = 5}};
    EXPECT_EQ(blocks, expected);
}

TEST_F(BlockSegmenterTest, ProseClosesBlockAndNextCodeOpensNewOne)
{
    auto blocks = segmenter_.form_code_blocks(std::string_view("import os\nhello there\nimport sys\n"));

    std::vector<LineRange> expected = {{.start = 0, .end = 0}, {.start = 2, .end = 2}};
    EXPECT_EQ(blocks, expected);
}

TEST_F(BlockSegmenterTest, ProseOnlyHasNoBlocks)
{
    EXPECT_TRUE(segmenter_.form_code_blocks(std::string_view("I like this and that\nnothing here")).empty());
}

TEST_F(BlockSegmenterTest, BlockOpenAtEndOfInputIsClosed)
{
    auto blocks = segmenter_.form_code_blocks(std::string_view("def f():\n    return 1"));

    std::vector<LineRange> expected = {{.start = 0, .end = 1}};
    EXPECT_EQ(blocks, expected);
}

TEST_F(BlockSegmenterTest, CandidateBlockKeepsTerminators)
{
    std::vector<std::string> lines = {"a\n", "b\r\n", "c"};

    auto block = make_candidate_block(lines, {.start = 1, .end = 2});

    EXPECT_EQ(block.text, "b\r\nc");
}

} // namespace pyspot
