/**
 * @file ParallelCommand.cpp
 * @brief Several worker processes advancing one bar.
 *
 * The parent creates the bar and enables parallel mode, then forks the
 * workers. Worker k gets rank k+1 through $TERMBAR_WORKER_RANK and handles
 * every items-th item starting at k. Worker 1 draws, the parent waits for
 * all of them and finishes the bar.
 */

#include "ParallelCommand.hpp"
#include "bar/ProgressBar.hpp"

#include <cerrno>
#include <cstring>
#include <random>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

REGISTER_COMMAND(ParallelCommand);

ParallelCommand::ParallelCommand(bool reg) : Command(reg, "parallel", "run a progress bar shared by worker processes") {
    m_parser.add_argument("-n", "--count").default_value(100).scan<'i', int>().help("number of items");
    m_parser.add_argument("-w", "--workers").default_value(4).scan<'i', int>().help("number of worker processes");
    m_parser.add_argument("-d", "--max-delay-ms").default_value(300).scan<'i', int>().help("upper bound of the random time spent on each item");
}

static void run_worker(ProgressBar& bar, int rank, int workers, int count, int max_delay){
    setenv(WORKER_RANK_ENV, std::to_string(rank).c_str(), 1);

    std::mt19937 rng(std::random_device{}() ^ static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> delay(0, max_delay);

    for( int i = rank; i <= count; i += workers ){
        std::this_thread::sleep_for(std::chrono::milliseconds(delay(rng)));
        bar.update(i);
    }
}

int ParallelCommand::run() {
    const int count = m_parser.get<int>("--count");
    const int workers = m_parser.get<int>("--workers");
    const int max_delay = m_parser.get<int>("--max-delay-ms");
    if( count < 0 || workers < 1 || max_delay < 0 ){
        logger->error("need --count >= 0, --workers >= 1 and --max-delay-ms >= 0");
        return 1;
    }

    ProgressBar bar(cli_bar_config(), count, fmt::format("Running parallel demo with {} items", count));
    bar.enable_parallel();

    // children inherit stdio buffers
    fflush(stdout);
    fflush(stderr);

    std::vector<pid_t> pids;
    for( int rank = 1; rank <= workers; rank++ ){
        pid_t pid = fork();
        if( pid == -1 ){
            logger->error("fork: {}", strerror(errno));
            break;
        }
        if( pid == 0 ){
            int rc = 0;
            try {
                run_worker(bar, rank, workers, count, max_delay);
            } catch( const std::exception& e ){
                logger->error("worker {}: {}", rank, e.what());
                rc = 1;
            }
            fflush(stdout);
            _exit(rc); // no destructors: the bar and its markers belong to the parent
        }
        pids.push_back(pid);
    }

    int failed = workers - static_cast<int>(pids.size());
    for( pid_t pid : pids ){
        int status = 0;
        while( waitpid(pid, &status, 0) == -1 ){
            if( errno != EINTR ){
                logger->error("waitpid({}): {}", pid, strerror(errno));
                break;
            }
        }
        if( !WIFEXITED(status) || WEXITSTATUS(status) != 0 ){
            failed++;
        }
    }

    bar.finish("{} items on {} workers in {}", count, workers, elapsed2human(bar.elapsed()));
    if( failed ){
        logger->error("{} of {} workers failed", failed, workers);
        return 1;
    }
    return 0;
}
