// test_watcher_gtest.cpp - File watcher scanning, dispatch and in-flight tracking

#include <gtest/gtest.h>
#include "../deck/watcher.hpp"
#include "../lib/file.h"
#include <pthread.h>
#include <cstdlib>
#include <sys/time.h>
#include <unistd.h>

using namespace deck;

static const char* SLIDE_XML =
    "<deck><canvas width=\"200\" height=\"100\"/><slide><rect xp=\"50\" yp=\"50\" wp=\"20\" hp=\"20\"/></slide></deck>";

// passthrough compiler that can hold every compile until released
class GatedCompiler : public DslCompiler {
public:
    GatedCompiler() : open_(true), calls_(0) {
        pthread_mutex_init(&mutex_, nullptr);
        pthread_cond_init(&cond_, nullptr);
    }
    ~GatedCompiler() override {
        pthread_cond_destroy(&cond_);
        pthread_mutex_destroy(&mutex_);
    }

    DeckStatus compile(const std::string& dsl, std::string* xml, DeckError* err) override {
        (void)err;
        pthread_mutex_lock(&mutex_);
        calls_++;
        while (!open_) pthread_cond_wait(&cond_, &mutex_);
        pthread_mutex_unlock(&mutex_);
        *xml = dsl;
        return DECK_OK;
    }

    void close() {
        pthread_mutex_lock(&mutex_);
        open_ = false;
        pthread_mutex_unlock(&mutex_);
    }

    void open() {
        pthread_mutex_lock(&mutex_);
        open_ = true;
        pthread_cond_broadcast(&cond_);
        pthread_mutex_unlock(&mutex_);
    }

    int calls() {
        pthread_mutex_lock(&mutex_);
        int n = calls_;
        pthread_mutex_unlock(&mutex_);
        return n;
    }

private:
    pthread_mutex_t mutex_;
    pthread_cond_t cond_;
    bool open_;
    int calls_;
};

class WatcherTest : public ::testing::Test {
protected:
    FontResolver fonts;
    GatedCompiler compiler;
    Pipeline pipeline{ &fonts, &compiler };
    WatchConfig config;
    char dir[64];

    void SetUp() override {
        snprintf(dir, sizeof(dir), "/tmp/deck-watch-XXXXXX");
        ASSERT_NE(mkdtemp(dir), nullptr);
        ASSERT_TRUE(create_dir(source_dir().c_str()));
        config.roots.push_back(source_dir());
        config.output_dir = std::string(dir) + "/out";
        config.formats = "svg,png";
        config.workers = 2;
        config.poll_interval = 1;
        config.shutdown_timeout = 5;
    }

    void TearDown() override {
        compiler.open();
        remove_dir(dir);
    }

    std::string source_dir() const { return std::string(dir) + "/src"; }

    std::string write_source(const char* name) {
        std::string path = source_dir() + "/" + name;
        EXPECT_TRUE(write_text_file(path.c_str(), SLIDE_XML));
        return path;
    }

    void make_stale(const std::string& path) {
        struct timeval times[2];
        gettimeofday(&times[0], nullptr);
        times[0].tv_sec -= 3600;
        times[1] = times[0];
        ASSERT_EQ(utimes(path.c_str(), times), 0);
    }
};

TEST_F(WatcherTest, OutputPathUsesStem) {
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.output_path("talks/intro.dsh", "svg"), config.output_dir + "/intro.svg");
    EXPECT_EQ(watcher.output_path("notes.txt", "pdf"), config.output_dir + "/notes.txt.pdf");
}

TEST_F(WatcherTest, ProcessFileWritesEveryFormat) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    std::string source = write_source("hello.dsh");
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.process_file(source), 2);
    EXPECT_TRUE(file_exists((config.output_dir + "/hello.svg").c_str()));
    EXPECT_TRUE(file_exists((config.output_dir + "/hello.png").c_str()));
    EXPECT_FALSE(file_exists((config.output_dir + "/hello.pdf").c_str()));
}

TEST_F(WatcherTest, ProcessFileKeepsCompiledDocument) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    std::string source = write_source("kept.dsh");
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.process_file(source), 2);
    char* compiled = read_text_file((config.output_dir + "/kept.dsh.xml").c_str());
    ASSERT_NE(compiled, nullptr);
    EXPECT_STREQ(compiled, SLIDE_XML);
    free(compiled);
}

TEST_F(WatcherTest, BadFormatDoesNotBlockOthers) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    config.formats = "gif, svg";
    std::string source = write_source("partial.dsh");
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.process_file(source), 1);
    EXPECT_TRUE(file_exists((config.output_dir + "/partial.svg").c_str()));
}

TEST_F(WatcherTest, MissingSourceWritesNothing) {
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.process_file(source_dir() + "/absent.dsh"), 0);
}

TEST_F(WatcherTest, ScanSkipsStaleAndOtherFiles) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    make_stale(write_source("old.dsh"));
    write_source("readme.txt");
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.scan(), 0);
}

TEST_F(WatcherTest, ScanRendersFreshSources) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    write_source("fresh.dsh");
    ASSERT_TRUE(create_dir((source_dir() + "/nested").c_str()));
    write_source("nested/deeper.dsh");
    Watcher watcher(&pipeline, config);
    EXPECT_EQ(watcher.scan(), 2);
    ASSERT_TRUE(watcher.wait_idle(10));
    EXPECT_TRUE(file_exists((config.output_dir + "/fresh.svg").c_str()));
    EXPECT_TRUE(file_exists((config.output_dir + "/deeper.png").c_str()));
}

TEST_F(WatcherTest, InFlightFileIsNotDispatchedTwice) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    std::string source = write_source("busy.dsh");
    Watcher watcher(&pipeline, config);

    compiler.close();
    EXPECT_EQ(watcher.scan(), 1);
    EXPECT_TRUE(watcher.is_in_flight(source));
    EXPECT_EQ(watcher.scan(), 0);

    compiler.open();
    ASSERT_TRUE(watcher.wait_idle(10));
    EXPECT_FALSE(watcher.is_in_flight(source));
    EXPECT_EQ(compiler.calls(), 1);

    // finished files are picked up again while still fresh
    EXPECT_EQ(watcher.scan(), 1);
    ASSERT_TRUE(watcher.wait_idle(10));
}

TEST_F(WatcherTest, StartAndStop) {
    write_source("start.dsh");
    Watcher watcher(&pipeline, config);
    ASSERT_TRUE(watcher.start());
    EXPECT_TRUE(watcher.is_running());
    EXPECT_TRUE(dir_exists(config.output_dir.c_str()));
    ASSERT_TRUE(watcher.wait_idle(10));
    watcher.stop();
    EXPECT_FALSE(watcher.is_running());
    EXPECT_TRUE(file_exists((config.output_dir + "/start.svg").c_str()));
}

TEST_F(WatcherTest, StopWithoutStart) {
    Watcher watcher(&pipeline, config);
    watcher.stop();
    EXPECT_FALSE(watcher.is_running());
}

static void* open_gate_later(void* arg) {
    usleep(200000);
    ((GatedCompiler*)arg)->open();
    return nullptr;
}

TEST_F(WatcherTest, DestroyWaitsForRenderBusyPastTimeout) {
    ASSERT_TRUE(create_dir(config.output_dir.c_str()));
    config.shutdown_timeout = 1;
    write_source("slow.dsh");
    Watcher* watcher = new Watcher(&pipeline, config);

    compiler.close();
    ASSERT_EQ(watcher->scan(), 1);
    for (int i = 0; i < 500 && compiler.calls() == 0; i++) usleep(10000);
    ASSERT_EQ(compiler.calls(), 1);

    EXPECT_FALSE(watcher->stop());
    pthread_t opener;
    ASSERT_EQ(pthread_create(&opener, nullptr, open_gate_later, &compiler), 0);
    delete watcher;
    pthread_join(opener, nullptr);

    // the render got past compiling before the watcher went away, then
    // skipped its formats because of the shutdown
    EXPECT_TRUE(file_exists((config.output_dir + "/slow.dsh.xml").c_str()));
    EXPECT_FALSE(file_exists((config.output_dir + "/slow.svg").c_str()));
}
