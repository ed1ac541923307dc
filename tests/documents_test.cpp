#include <gtest/gtest.h>
#include <fakeadapter.hpp>
#include <tempdir.hpp>
#include <executable.hpp>
#include <registry.hpp>
#include <sources/FileDocumentSource.hpp>
#include <sources/MemoryDocumentSource.hpp>
#include <algorithm>
#include <thread>


class FileSourceTest : public ::testing::Test {
protected:
    TempDir dir;
    LanguageRegistry registry;
    std::shared_ptr<FakeAdapter> js = std::make_shared<FakeAdapter>("js", true, "js");
    std::shared_ptr<FakeAdapter> py = std::make_shared<FakeAdapter>("py", true, "py");

    void SetUp() override {
        ASSERT_NE(dir.path, "");
        registry.addAdapter(js);
        registry.addAdapter(py);
    }

    ParsingContext contextFor(DocumentSource* source) {
        ParsingContext context;
        context.registry = &registry;
        context.defaultLanguageTag = "js";
        context.documentSource = source;
        return context;
    }
};


TEST_F(FileSourceTest, NamesResolveWithOrWithoutExtension) {
    dir.write("page.js", "page");
    FileDocumentSource source(dir.path);
    EXPECT_EQ(source.getDocument("page.js") -> sourceCode, "page");
    std::shared_ptr<DocumentDescriptor> descriptor = source.getDocument("page");
    EXPECT_EQ(descriptor -> sourceCode, "page");
    EXPECT_EQ(descriptor -> name, "page");
    EXPECT_EQ(descriptor -> tag, "js");
    EXPECT_EQ(source.fileForDocumentName("page"), source.fileForDocumentName("page.js"));
}

TEST_F(FileSourceTest, PreferredExtensionBreaksTies) {
    dir.write("post.html", "html");
    dir.write("post.py", "py");
    FileDocumentSource plain(dir.path);
    EXPECT_EQ(plain.getDocument("post") -> sourceCode, "html"); // first by name
    FileDocumentSource preferring(dir.path, "index", "py");
    EXPECT_EQ(preferring.getDocument("post") -> sourceCode, "py");
}

TEST_F(FileSourceTest, DirectoryResolvesToItsDefaultFile) {
    dir.write("blog/index.js", "front page");
    dir.write("blog/other.js", "other");
    FileDocumentSource source(dir.path);
    EXPECT_EQ(source.checkPath("blog"), FileDocumentSource::Directory);
    EXPECT_EQ(source.checkPath("blog/other.js"), FileDocumentSource::File);
    EXPECT_EQ(source.checkPath("blog/nope"), FileDocumentSource::CNEP);
    EXPECT_EQ(source.getDocument("blog") -> sourceCode, "front page");
    EXPECT_EQ(source.getDocument("blog/other") -> sourceCode, "other");

    FileDocumentSource home(dir.path, "other");
    EXPECT_EQ(home.getDocument("blog") -> sourceCode, "other");
}

TEST_F(FileSourceTest, MissingDocumentsAreNotFound) {
    dir.write("blog/index.js", "front page");
    FileDocumentSource source(dir.path);
    EXPECT_THROW(source.getDocument("nothing"), DocumentNotFoundError);
    EXPECT_THROW(source.getDocument("blog/nothing"), DocumentNotFoundError);
    EXPECT_THROW(source.getDocument("nothing/at/all"), DocumentNotFoundError);

    FileDocumentSource nowhere(fconcat(dir.path, "missing"));
    EXPECT_THROW(nowhere.getDocument("index"), DocumentNotFoundError);
}

TEST_F(FileSourceTest, DescriptorsAreCached) {
    dir.write("page.js", "page");
    FileDocumentSource source(dir.path);
    std::shared_ptr<DocumentDescriptor> first = source.getDocument("page");
    EXPECT_EQ(source.getDocument("page"), first);
    EXPECT_EQ(source.getCachedDescriptor("page"), first);
    EXPECT_EQ(source.getCachedDescriptor("elsewhere"), nullptr);
    EXPECT_TRUE(first -> isValid());
}

TEST_F(FileSourceTest, TouchedFilesAreReloaded) {
    dir.write("page.js", "old");
    FileDocumentSource source(dir.path);
    std::shared_ptr<DocumentDescriptor> first = source.getDocument("page");
    EXPECT_EQ(first -> sourceCode, "old");

    dir.write("page.js", "new");
    dir.touch("page.js");
    std::shared_ptr<DocumentDescriptor> second = source.getDocument("page");
    EXPECT_NE(second, first);
    EXPECT_EQ(second -> sourceCode, "new");
    EXPECT_FALSE(first -> isValid());
    EXPECT_FALSE(first -> isValid()); // sticky
    EXPECT_TRUE(second -> isValid());
}

TEST_F(FileSourceTest, DeletedFilesAreInvalid) {
    dir.write("page.js", "here");
    FileDocumentSource source(dir.path);
    std::shared_ptr<DocumentDescriptor> descriptor = source.getDocument("page.js");
    unlink(fconcat(dir.path, "page.js").c_str());
    EXPECT_FALSE(descriptor -> isValid());
    EXPECT_THROW(source.getDocument("page.js"), DocumentNotFoundError);
}

TEST_F(FileSourceTest, ThrottleKeepsStaleDescriptorsForAWhile) {
    dir.write("page.js", "old");
    FileDocumentSource source(dir.path, "index", "", 60000);
    EXPECT_EQ(source.getMinimumTimeBetweenValidityChecks(), 60000);
    std::shared_ptr<DocumentDescriptor> first = source.getDocument("page");
    EXPECT_EQ(source.getDocument("page"), first); // the first check actually stats the file

    dir.write("page.js", "new");
    dir.touch("page.js");
    EXPECT_EQ(source.getDocument("page"), first); // checked too recently to look again
    EXPECT_EQ(first -> sourceCode, "old");
}

TEST_F(FileSourceTest, DisabledChecksNeverInvalidate) {
    dir.write("page.js", "old");
    FileDocumentSource source(dir.path, "index", "", VALIDITY_CHECKS_DISABLED);
    std::shared_ptr<DocumentDescriptor> first = source.getDocument("page");
    dir.touch("page.js");
    EXPECT_TRUE(first -> isValid());
    EXPECT_EQ(source.getDocument("page"), first);
}

TEST_F(FileSourceTest, StaleDependencyInvalidatesDependents) {
    dir.write("outer.js", "outer");
    dir.write("inner.js", "inner");
    FileDocumentSource source(dir.path);
    std::shared_ptr<DocumentDescriptor> outer = source.getDocument("outer");
    std::shared_ptr<DocumentDescriptor> inner = source.getDocument("inner");
    outer -> addDependency("inner");
    outer -> addDependency("never-loaded"); // not cached, so it can't go stale
    EXPECT_TRUE(outer -> isValid());

    dir.touch("inner.js");
    EXPECT_FALSE(outer -> isValid());
    EXPECT_NE(source.getDocument("outer"), outer);
}

TEST_F(FileSourceTest, CreateOnceCompilesOnceAcrossThreads) {
    dir.write("page.js", "a<% out b;%>");
    FileDocumentSource source(dir.path);
    ParsingContext context = contextFor(&source);
    std::vector<std::shared_ptr<Executable>> seen(8);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i ++) {
        threads.emplace_back([&, i]() {
            seen[i] = Executable::createOnce("page", true, context) -> getExecutable();
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }
    ASSERT_NE(seen[0], nullptr);
    for (int i = 1; i < 8; i ++) {
        EXPECT_EQ(seen[i], seen[0]);
    }
    EXPECT_EQ(seen[0] -> partition, dir.path);
    EXPECT_EQ(seen[0] -> documentName, "page");
    EXPECT_EQ(Executable::createOnce("page", true, context) -> getExecutable(), seen[0]);
}

TEST_F(FileSourceTest, CreateOnceRecompilesAfterAChange) {
    dir.write("page.js", "<% out one;%>");
    FileDocumentSource source(dir.path);
    ParsingContext context = contextFor(&source);
    std::shared_ptr<Executable> first = Executable::createOnce("page", true, context) -> getExecutable();

    dir.write("page.js", "<% out two;%>");
    dir.touch("page.js");
    std::shared_ptr<Executable> second = Executable::createOnce("page", true, context) -> getExecutable();
    ASSERT_NE(second, first);

    StringWriteOutput out;
    Writer writer(out);
    ExecutionContext ctx(&writer);
    second -> execute(&ctx);
    EXPECT_EQ(out.content, "two");
}

TEST_F(FileSourceTest, CreateOncePicksTheLanguageFromTheExtension) {
    dir.write("script.py", "<% out p;%>");
    dir.write("page.html", "<% out h;%>");
    FileDocumentSource source(dir.path);
    ParsingContext context = contextFor(&source);
    EXPECT_EQ(Executable::createOnce("script", true, context) -> getExecutable() -> segments[0].languageTag, "py");
    EXPECT_EQ(Executable::createOnce("page", true, context) -> getExecutable() -> segments[0].languageTag, "js");
}

TEST_F(FileSourceTest, ParseErrorsCacheNothing) {
    dir.write("broken.js", "<% out x;");
    FileDocumentSource source(dir.path);
    ParsingContext context = contextFor(&source);
    EXPECT_THROW(Executable::createOnce("broken", true, context), ParsingError);
    ASSERT_NE(source.getCachedDescriptor("broken"), nullptr);
    EXPECT_EQ(source.getCachedDescriptor("broken") -> getExecutable(), nullptr);
}

TEST_F(FileSourceTest, RecompilingDropsTheOldInFlowDocuments) {
    dir.write("page.js", "<%: py out a;%>");
    FileDocumentSource source(dir.path);
    ParsingContext context = contextFor(&source);
    std::shared_ptr<Executable> first = Executable::createOnce("page", true, context) -> getExecutable();
    ASSERT_EQ(first -> dependencies.size(), 1);
    std::string oldName = *first -> dependencies.begin();
    ASSERT_NE(source.getCachedDescriptor(oldName), nullptr);

    dir.write("page.js", "<%: py out b;%>");
    dir.touch("page.js");
    std::shared_ptr<Executable> second = Executable::createOnce("page", true, context) -> getExecutable();
    ASSERT_NE(second, first);
    ASSERT_EQ(second -> dependencies.size(), 1);
    std::string newName = *second -> dependencies.begin();
    EXPECT_NE(newName, oldName);
    EXPECT_EQ(source.getCachedDescriptor(oldName), nullptr);
    ASSERT_NE(source.getCachedDescriptor(newName), nullptr);
    EXPECT_EQ(source.getCachedDescriptor(newName) -> sourceCode, "<%py out b;%>");
}

TEST_F(FileSourceTest, ReplacingADocumentDropsItsInFlowDocuments) {
    MemoryDocumentSource source;
    ParsingContext context = contextFor(&source);
    source.setDocument("page", "<%: py out a;%>", "", NULL);
    std::string inFlowName = *Executable::createOnce("page", true, context) -> getExecutable() -> dependencies.begin();
    EXPECT_EQ(source.getDocuments().size(), 2);

    source.setDocument("page", "plain", "", NULL);
    EXPECT_EQ(source.getCachedDescriptor(inFlowName), nullptr);
    EXPECT_EQ(source.getDocuments().size(), 1);
}

TEST_F(FileSourceTest, FailedCompilesRegisterNoInFlowDocuments) {
    MemoryDocumentSource source;
    ParsingContext context = contextFor(&source);
    source.setDocument("page", "<%: py out hi;%><%elvish x%>", "", NULL);
    EXPECT_THROW(Executable::createOnce("page", true, context), ParsingError);
    EXPECT_EQ(source.getDocuments().size(), 1);
    EXPECT_EQ(source.getDocument("page") -> getExecutable(), nullptr);
}

TEST_F(FileSourceTest, CreateOnceNeedsASource) {
    ParsingContext context = contextFor(NULL);
    EXPECT_THROW(Executable::createOnce("page", true, context), DocumentError);
}

TEST_F(FileSourceTest, InMemoryDocumentsLiveBesideFiles) {
    dir.write("page.js", "file");
    FileDocumentSource source(dir.path);
    EXPECT_EQ(source.setDocument("virtual", "memory", "py", NULL), nullptr);
    std::shared_ptr<DocumentDescriptor> existing = source.setDocumentIfAbsent("virtual", "ignored", "py", NULL);
    ASSERT_NE(existing, nullptr);
    EXPECT_EQ(existing -> sourceCode, "memory");

    std::shared_ptr<DocumentDescriptor> descriptor = source.getDocument("virtual");
    EXPECT_EQ(descriptor -> sourceCode, "memory");
    EXPECT_EQ(descriptor -> file, "");
    EXPECT_TRUE(descriptor -> isValid());

    std::shared_ptr<DocumentDescriptor> replaced = source.setDocument("virtual", "again", "py", NULL);
    EXPECT_EQ(replaced, descriptor);
    EXPECT_EQ(source.getDocument("virtual") -> sourceCode, "again");
}

TEST_F(FileSourceTest, GetDocumentsSkipsHiddenFiles) {
    dir.write("a.js", "a");
    dir.write(".hidden.js", "hidden");
    dir.write(".git/config", "hidden too");
    dir.write("sub/b.py", "b");
    FileDocumentSource source(dir.path);
    source.setDocument("virtual", "v", "js", NULL);

    std::vector<std::string> contents;
    for (std::shared_ptr<DocumentDescriptor>& descriptor : source.getDocuments()) {
        contents.push_back(descriptor -> sourceCode);
    }
    std::sort(contents.begin(), contents.end());
    EXPECT_EQ(contents, std::vector<std::string>({"a", "b", "v"}));
}


TEST(MemorySourceTest, StoresAndReturnsDocuments) {
    MemoryDocumentSource source;
    EXPECT_EQ(source.getIdentifier(), "memory");
    EXPECT_THROW(source.getDocument("nope"), DocumentNotFoundError);
    EXPECT_EQ(source.setDocument("one", "1", "js", NULL), nullptr);
    EXPECT_NE(source.setDocumentIfAbsent("one", "2", "js", NULL), nullptr);
    EXPECT_EQ(source.getDocument("one") -> sourceCode, "1");
    EXPECT_EQ(source.getDocument("one") -> tag, "js");
    EXPECT_EQ(source.getDocuments().size(), 1);
    EXPECT_EQ(source.getMinimumTimeBetweenValidityChecks(), VALIDITY_CHECKS_DISABLED);
}

TEST(MemorySourceTest, DescriptorWithStaleDependencyIsDropped) {
    TempDir dir;
    dir.write("inner.js", "inner");
    FileDocumentSource files(dir.path);

    struct Mixed : MemoryDocumentSource { // resolves dependencies against a file source
        FileDocumentSource* files;
        Mixed(FileDocumentSource* f) : files(f) {}
        std::shared_ptr<DocumentDescriptor> getCachedDescriptor(std::string documentName) {
            std::shared_ptr<DocumentDescriptor> mine = MemoryDocumentSource::getCachedDescriptor(documentName);
            return mine != NULL ? mine : files -> getCachedDescriptor(documentName);
        }
    } source(&files);

    files.getDocument("inner");
    source.setDocument("outer", "outer", "js", NULL);
    source.getCachedDescriptor("outer") -> addDependency("inner"); // before anything decides it's valid for good
    EXPECT_EQ(source.getDocument("outer") -> sourceCode, "outer");

    dir.touch("inner.js");
    EXPECT_THROW(source.getDocument("outer"), DocumentNotFoundError);
    EXPECT_EQ(source.getDocuments().size(), 0);
}
