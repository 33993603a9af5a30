#include "csumattr.hh"

#include <algorithm>
#include <set>
#include <utility>
#include <dirent.h>
#include <stdio.h>
#include <regex>

namespace {
  std::regex ents_to_skip("^\\.\\.?$"); // matches "." and ".."
  class tree_walk {
    const std::vector<file_predicate> filters, descend_into;
    const std::function<void(const candidate_file&)>& visit;
    std::set<std::pair<dev_t, ino_t>> seen_dirs;
  public:
    tree_walk(dev_t root_dev,
              const std::function<void(const candidate_file&)>& visit)
      : filters(default_filters(root_dev)),
        descend_into(descend_filters(root_dev)), visit(visit) {}
    void descend(const std::string& path, const struct stat& st) {
      if(!seen_dirs.emplace(st.st_dev, st.st_ino).second) return;
      DIR* d = opendir(path.c_str());
      if(!d) {
        perror(path.c_str());
        return;
      }
      std::vector<std::string> names;
      struct dirent* ent;
      while((ent = readdir(d)) != nullptr) {
        if(std::regex_match(ent->d_name, ents_to_skip))
          continue; // skip . and ..
        names.emplace_back(ent->d_name);
      }
      closedir(d);
      std::sort(names.begin(), names.end());
      std::string prefix = path;
      if(prefix.empty() || prefix[prefix.size()-1] != '/') prefix += '/';
      for(auto&& name : names) {
        std::string child = prefix + name;
        struct stat child_st;
        if(lstat(child.c_str(), &child_st)) {
          perror(child.c_str());
          continue;
        }
        if(S_ISDIR(child_st.st_mode)) {
          if(passes_all(descend_into, child, child_st))
            descend(child, child_st);
        }
        else if(passes_all(filters, child, child_st)) {
          visit(candidate_file{child, child_st.st_size});
        }
      }
    }
  };
}

file_predicate is_regular_file() {
  return [](const std::string&, const struct stat& st) {
    return S_ISREG(st.st_mode);
  };
}

file_predicate is_directory() {
  return [](const std::string&, const struct stat& st) {
    return S_ISDIR(st.st_mode);
  };
}

file_predicate is_non_empty() {
  return [](const std::string&, const struct stat& st) {
    return st.st_size > 0;
  };
}

file_predicate on_device(dev_t dev) {
  return [dev](const std::string&, const struct stat& st) {
    return st.st_dev == dev;
  };
}

std::vector<file_predicate> default_filters(dev_t root_dev) {
  return std::vector<file_predicate>{
    is_regular_file(), on_device(root_dev), is_non_empty()
  };
}

std::vector<file_predicate> descend_filters(dev_t root_dev) {
  return std::vector<file_predicate>{ is_directory(), on_device(root_dev) };
}

bool passes_all(const std::vector<file_predicate>& filters,
                const std::string& path,
                const struct stat& st) {
  for(auto&& filter : filters) {
    if(!filter(path, st)) return false;
  }
  return true;
}

target_kind classify_target(const std::string& path, struct stat& st) {
  if(path.empty() || stat(path.c_str(), &st)) return target_kind::missing;
  if(S_ISDIR(st.st_mode)) return target_kind::directory;
  if(S_ISREG(st.st_mode)) return target_kind::file;
  return target_kind::missing;
}

void select_files(const std::string& target,
                  const struct stat& root_st,
                  const std::function<void(const candidate_file&)>& visit) {
  if(S_ISDIR(root_st.st_mode)) {
    tree_walk walk(root_st.st_dev, visit);
    walk.descend(target, root_st);
  }
  else if(passes_all(default_filters(root_st.st_dev), target, root_st)) {
    visit(candidate_file{target, root_st.st_size});
  }
}
