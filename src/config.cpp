#include "config.hpp"

namespace codejudge {
using namespace std;

size_t SOURCE_SIZE_LIMIT = 256 * 1024;          // 256K
size_t EXECUTABLE_SIZE_LIMIT = 64 * 1024 * 1024;  // 64M
int COMPILE_TIME_LIMIT = 15000;                   // 15s
size_t OUTPUT_LIMIT = 64 * 1024 * 1024;           // 64M
int MEMORY_SAMPLE_INTERVAL = 30;                  // 30ms
bool ENFORCE_MEMORY_LIMIT = false;

filesystem::path CACHE_DIR = "/tmp/codejudge/cache";
filesystem::path RUN_ARTIFACT_DIR = "/tmp/codejudge/runs";
int RUN_ARTIFACT_RETENTION = 30 * 60;  // 30min

string C_COMPILER = "gcc";
string CXX_COMPILER = "g++";
bool DEBUG = false;

}  // namespace codejudge
