#include "csumattr.hh"

#include <sys/types.h>
#include <attr/xattr.h>
#include <errno.h>
#include <stdio.h>

const char* const checksum_attr_name = "user.sha256sum";

attribute_store::status
xattr_attribute_store::get(const std::string& path, std::string& value) {
  ssize_t size = getxattr(path.c_str(), checksum_attr_name, nullptr, 0);
  if(size < 0) {
    if(errno == ENOATTR) return status::absent;
    perror(path.c_str());
    return status::failed;
  }
  value.resize(size);
  if(size == 0) return status::present;
  ssize_t got = getxattr(path.c_str(), checksum_attr_name,
                         &value[0], value.size());
  if(got < 0) {
    if(errno == ENOATTR) return status::absent; // removed in between
    perror(path.c_str());
    return status::failed;
  }
  value.resize(got);
  return status::present;
}

bool xattr_attribute_store::set(const std::string& path,
                                const std::string& value,
                                bool create_only) {
  if(setxattr(path.c_str(), checksum_attr_name,
              value.data(), value.size(), create_only ? XATTR_CREATE : 0)) {
    perror(path.c_str());
    return false;
  }
  return true;
}

bool xattr_attribute_store::remove(const std::string& path) {
  if(removexattr(path.c_str(), checksum_attr_name)) {
    if(errno == ENOATTR) return true;
    perror(path.c_str());
    return false;
  }
  return true;
}
