#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

// ibench-sandbox: reads one serialized SandboxOptions from stdin, runs it in
//   cjail and writes the raw cjail_result to stdout.

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = (char*)buf;
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

// a sanity bound on the serialized options
constexpr long kMaxOptionSize = 16L << 20;

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0 || sz > kMaxOptionSize) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res = {};
  SandboxOptions opt;
  if (!opt.Deserialize(buf)) {
    res.oomkill = EINVAL;
    res.timekill = -1;
  } else {
    CJailCtxClass ctx;
    opt.ToCJailCtx(ctx);
    if (cjail_exec(&ctx.GetCtx(), &res) < 0) {
      res.oomkill = errno;
      res.timekill = -1;
    }
  }
  if (write(1, &res, sizeof(res)) != (ssize_t)sizeof(res)) return 1;
}
