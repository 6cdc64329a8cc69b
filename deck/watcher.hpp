// watcher.hpp - Poll directories for changed .dsh sources and re-render them
//
// One polling thread walks the roots every poll interval; each fresh source
// file not already being rendered is handed to the worker pool, which
// compiles it once and writes every configured format to the output
// directory, next to the compiled document "<stem>.dsh.xml". A render
// failure in one format never blocks the others.

#ifndef DECK_WATCHER_HPP
#define DECK_WATCHER_HPP

#include "defaults.hpp"
#include "document.hpp"
#include "pipeline.hpp"
#include "task_pool.hpp"
#include <pthread.h>
#include <set>
#include <string>
#include <vector>

namespace deck {

struct WatchConfig {
    std::vector<std::string> roots;
    std::string formats = "svg,png,pdf";        // comma separated format ids
    std::string output_dir = "output";
    int poll_interval = WATCH_POLL_INTERVAL;            // seconds between scans
    int freshness_window = WATCH_FRESHNESS_WINDOW;      // only files modified this recently
    int shutdown_timeout = WATCH_SHUTDOWN_TIMEOUT;      // seconds stop() waits for tasks
    int workers = 0;                                    // 0 picks the pool default
    RenderOptions options;
};

class Watcher {
public:
    Watcher(Pipeline* pipeline, const WatchConfig& config);
    ~Watcher();

    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;

    // create the output directory, scan once and start polling
    bool start();
    // stop polling and wait up to the shutdown timeout for running renders;
    // false when renders were still busy. Those finish before ~Watcher returns.
    bool stop();

    // one pass over the roots; returns the number of renders dispatched
    int scan();

    // compile path and write every configured format synchronously;
    // returns the number of artifacts written
    int process_file(const std::string& path);

    // wait until no render is queued or running; false on timeout
    bool wait_idle(double timeout_seconds);

    bool is_running() const { return running_; }
    bool is_in_flight(const std::string& path);
    const WatchConfig& config() const { return config_; }

    // "<output_dir>/<stem>.<ext>" for a source path
    std::string output_path(const std::string& source, const char* extension) const;

private:
    static void* poll_thread_func(void* arg);
    static void render_task(void* task_data);
    static void visit_source(const char* path, void* udata);

    bool mark_in_flight(const std::string& path);
    void clear_in_flight(const std::string& path);
    bool is_stopping();

    Pipeline* pipeline_;
    WatchConfig config_;
    std::vector<std::string> formats_;
    TaskPool* pool_;

    pthread_t thread_;
    bool running_;
    bool stopping_;
    pthread_mutex_t mutex_;     // guards in_flight_ and stopping_
    pthread_cond_t wake_;       // interrupts the poll sleep on stop
    std::set<std::string> in_flight_;
    int dispatched_;            // renders dispatched by the current scan
};

} // namespace deck

#endif // DECK_WATCHER_HPP
