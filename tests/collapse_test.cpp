#include <gtest/gtest.h>
#include <fakeadapter.hpp>
#include <segmenter.hpp>
#include <registry.hpp>


class CollapseTest : public ::testing::Test {
protected:
    LanguageRegistry registry;
    std::shared_ptr<FakeAdapter> js = std::make_shared<FakeAdapter>("js");
    std::shared_ptr<FakeAdapter> py = std::make_shared<FakeAdapter>("py");
    ParsingContext context;

    void SetUp() override {
        registry.addAdapter(js);
        registry.addAdapter(py);
        context.registry = &registry;
        context.defaultLanguageTag = "js";
    }

    std::string run(Executable& executable) {
        StringWriteOutput out;
        Writer writer(out);
        ExecutionContext ctx(&writer);
        executable.execute(&ctx);
        return out.content;
    }
};


TEST_F(CollapseTest, NeighboringScriptletsMerge) {
    Executable executable("doc", "test", 0, "<%js out a;%><%js out b;%>", true, context);
    ASSERT_EQ(executable.segments.size(), 1);
    EXPECT_EQ(executable.segments[0].sourceText, "out a;out b;");
    EXPECT_EQ(js -> programsCreated.load(), 1);
    EXPECT_EQ(run(executable), "ab");
}

TEST_F(CollapseTest, LeadingLiteralStaysLiteral) {
    Executable executable("doc", "test", 0, "x<%js out a;%>y", true, context);
    ASSERT_EQ(executable.segments.size(), 2);
    EXPECT_FALSE(executable.segments[0].isProgram());
    EXPECT_EQ(executable.segments[0].sourceText, "x");
    EXPECT_TRUE(executable.segments[1].isProgram());
    EXPECT_EQ(executable.segments[1].sourceText, "out a;out y;");
    EXPECT_EQ(run(executable), "xay");
}

TEST_F(CollapseTest, HelloWorldExampleEndsAsTwoSegments) {
    Executable executable("doc", "test", 0, "Hello <%=js 2+2%> World", true, context);
    ASSERT_EQ(executable.segments.size(), 2);
    EXPECT_EQ(executable.segments[0].sourceText, "Hello ");
    EXPECT_EQ(executable.segments[1].sourceText, "outexpr 2+2;out  World;");
}

TEST_F(CollapseTest, LanguagesDoNotMerge) {
    Executable executable("doc", "test", 0, "<%js out a;%><%py out b;%>", true, context);
    ASSERT_EQ(executable.segments.size(), 2);
    EXPECT_EQ(executable.segments[0].languageTag, "js");
    EXPECT_EQ(executable.segments[1].languageTag, "py");
    EXPECT_EQ(js -> programsCreated.load(), 1);
    EXPECT_EQ(py -> programsCreated.load(), 1);
    EXPECT_EQ(run(executable), "ab");
}

TEST_F(CollapseTest, LiteralFoldsIntoTheLanguageBeforeIt) {
    Executable executable("doc", "test", 0, "<%py out a;%>mid<%js out b;%>end", true, context);
    ASSERT_EQ(executable.segments.size(), 2);
    EXPECT_EQ(executable.segments[0].sourceText, "out a;out mid;");
    EXPECT_EQ(executable.segments[1].sourceText, "out b;out end;");
    EXPECT_EQ(run(executable), "amidbend");
}

TEST_F(CollapseTest, LiteralsNeedingEscapesSurviveFolding) {
    Executable executable("doc", "test", 0, "<%js out a;%>semi;colon \\ slash", true, context);
    EXPECT_EQ(run(executable), "asemi;colon \\ slash");
}

TEST_F(CollapseTest, PositionsFollowTheCollapsedOrder) {
    Executable executable("doc", "test", 0, "a<%py out 1;%>b<%js out 2;%>c<%py out 3;%>", true, context);
    ASSERT_EQ(executable.segments.size(), 4);
    for (size_t i = 0; i < executable.segments.size(); i ++) {
        EXPECT_EQ(executable.segments[i].position, (int)i);
        if (executable.segments[i].isProgram()) {
            EXPECT_EQ(executable.segments[i].program -> position, (int)i);
            EXPECT_NE(executable.segments[i].adapter, nullptr);
        }
    }
}

TEST_F(CollapseTest, CollapsingPreservesOutput) {
    std::string text = "head <%js out 1;%> and <%=py 20+2%><%=py 1+1%>\n<%js out 3;%>tail";

    Executable collapsed("doc", "test", 0, text, true, context);
    StringWriteOutput collapsedOut;
    Writer collapsedWriter(collapsedOut);
    ExecutionContext collapsedContext(&collapsedWriter);
    collapsed.execute(&collapsedContext);

    // the same document, resolved without collapsing, run segment by segment
    Executable holder("doc", "test", 0, "", true, context);
    std::vector<Segment> segments = segmentDocument(holder, text, context);
    materializeSegments(holder, segments, context);
    resolveSegments(holder, segments, context);
    StringWriteOutput plainOut;
    Writer plainWriter(plainOut);
    ExecutionContext plainContext(&plainWriter);
    for (Segment& segment : segments) {
        if (segment.isProgram()) {
            segment.program -> execute(&plainContext);
        }
        else {
            plainWriter.write(segment.sourceText);
        }
    }

    EXPECT_EQ(collapsedOut.content, plainOut.content);
    EXPECT_EQ(collapsedOut.content, "head 1 and 222\n3tail");
    EXPECT_LT(collapsed.segments.size(), segments.size());
}

TEST_F(CollapseTest, PrepareRejectsBadSourceAtConstruction) {
    context.prepare = true;
    EXPECT_THROW(Executable("doc", "test", 0, "<%js frobnicate;%>", true, context), ParsingError);
}

TEST_F(CollapseTest, WithoutPrepareBadSourceFailsWhenRun) {
    Executable executable("doc", "test", 0, "\n  <%js frobnicate;%>", true, context);
    try {
        run(executable);
        FAIL() << "ran an unknown command";
    }
    catch (ExecutionError& e) {
        ASSERT_GE(e.stack.size(), 1);
        EXPECT_EQ(e.stack[0].documentName, "doc");
        EXPECT_EQ(e.stack[0].line, 2);
        EXPECT_EQ(e.stack[0].column, 3);
    }
}
