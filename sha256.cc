#include "csumattr.hh"

#include <memory>
#include <openssl/evp.h>
#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

namespace {
  struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };
  const char hex_digits[] = "0123456789abcdef";
  /* feeds the whole of fd to ctx; false on a read error */
  bool hash_fd(const std::string& path, int fd, EVP_MD_CTX* ctx) {
    char buf[65536];
    ssize_t red;
    while((red = read(fd, buf, sizeof(buf))) > 0) {
      if(EVP_DigestUpdate(ctx, buf, red) != 1) {
        std::cerr << path << ": EVP_DigestUpdate failed\n";
        return false;
      }
    }
    if(red < 0) {
      perror(path.c_str());
      return false;
    }
    return true;
  }
}

bool sha256_digest_provider::digest(const std::string& path,
                                    std::string& out) {
  std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    std::cerr << path << ": could not set up SHA-256\n";
    return false;
  }
  int fd = open(path.c_str(), O_RDONLY);
  if(fd < 0) {
    perror(path.c_str());
    return false;
  }
  bool hashed = hash_fd(path, fd, ctx.get());
  close(fd);
  if(!hashed) return false;
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if(EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
    std::cerr << path << ": EVP_DigestFinal_ex failed\n";
    return false;
  }
  out.clear();
  out.reserve(md_len * 2);
  for(unsigned int n = 0; n < md_len; ++n) {
    out += hex_digits[md[n] >> 4];
    out += hex_digits[md[n] & 15];
  }
  return true;
}
