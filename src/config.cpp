#include "config.hpp"

namespace ptyrun {
using namespace std;

chrono::seconds DEFAULT_TIMEOUT(300);
chrono::milliseconds KILL_GRACE_PERIOD(5000);
chrono::milliseconds EXIT_SETTLE_PERIOD(200);
chrono::seconds COMPILE_TIME_LIMIT(60);

string COMPILER = "g++";
string COMPILER_STANDARD = "-std=c++11";
filesystem::path SANDBOX_ROOT = "logs";

size_t OUTPUT_CHUNK_SIZE = 1024;
size_t TRANSCRIPT_LIMIT = 1000;
size_t ERROR_EXCERPT_LIMIT = 500;

}  // namespace ptyrun
