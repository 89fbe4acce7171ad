#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace ptyrun {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief Converts every argument to a string and appends it to cont
 * @param cont string container
 * @param args converted in order; a container argument is flattened
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief Outcome of a synchronous external command
 */
struct process_output {
    /**
     * @brief Exit status of the command, -1 if it died from a signal
     */
    int exit_code = -1;

    /**
     * @brief True if the command was killed because it ran past its time limit
     */
    bool timed_out = false;

    /**
     * @brief Everything the command wrote to stdout and stderr, interleaved
     */
    std::string output;
};

/**
 * @brief Runs an external command and collects its output
 * The command runs in its own process group with stdin bound to /dev/null.
 * When the time limit expires the whole group is killed.
 * @param argv path of the command (argv[0]) and its arguments, null terminated
 * @param time_limit wall-clock limit of the command
 * @throw process_error if the command cannot be executed at all
 */
process_output exec_program(const char **argv, std::chrono::milliseconds time_limit);

/**
 * @brief Type safe wrapper of exec_program
 * @note unlike system(cmd), the arguments are never interpreted by a shell
 * @code{.cpp}
 *     std::filesystem::path source("/tmp/main.cpp");
 *     auto result = call_process(10s, "g++", "-o", "main", source);
 * @endcode
 */
template <typename... Args>
process_output call_process(std::chrono::milliseconds time_limit, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv(list.size() + 1, nullptr);
    for (size_t i = 0; i < list.size(); ++i)
        argv[i] = list[i].data();

#ifndef NDEBUG
    std::stringstream ss;
    for (size_t i = 0; i < list.size(); ++i)
        ss << argv[i] << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(argv.data(), time_limit);
}

/**
 * @brief Looks up an environment variable
 * @param key name of the variable
 * @param def_value returned when the variable is not set
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace ptyrun
