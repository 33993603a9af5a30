#ifndef CSUMATTRHH
#define CSUMATTRHH

#include <iostream>
#include <string>
#include <vector>
#include <functional>
#include <sys/types.h>
#include <sys/stat.h>

/* Per-file result. The values double as process exit statuses; 2 is kept
   free for a missing target. */
enum class outcome : int {
  success = 0,
  attribute_missing = 1,
  checksum_mismatch = 3,
};
const int exit_not_found = 2;
const int exit_usage = 64; // EX_USAGE

/* whichever of the two is more severe */
outcome worst(outcome a, outcome b);

enum class action { add, check, remove, update, print };

/* Where an action writes and how loudly. print lines go to `out`,
   everything else to `err`. */
struct run_context {
  std::ostream& out;
  std::ostream& err;
  bool verbose;
  bool dry_run;
};

class attribute_store {
public:
  enum class status { present, absent, failed };
  virtual ~attribute_store() {}
  virtual status get(const std::string& path, std::string& value) = 0;
  /* with create_only, fails rather than replace an existing value */
  virtual bool set(const std::string& path, const std::string& value,
                   bool create_only) = 0;
  /* true if the attribute is gone afterwards, including when there was
     none to begin with */
  virtual bool remove(const std::string& path) = 0;
};

extern const char* const checksum_attr_name;

/* the checksum attribute as an extended attribute, via libattr */
class xattr_attribute_store : public attribute_store {
public:
  status get(const std::string& path, std::string& value) override;
  bool set(const std::string& path, const std::string& value,
           bool create_only) override;
  bool remove(const std::string& path) override;
};

class digest_provider {
public:
  virtual ~digest_provider() {}
  /* lowercase hex digest of the whole file into `out`; false (after
     reporting why) if the file could not be read */
  virtual bool digest(const std::string& path, std::string& out) = 0;
};

class sha256_digest_provider : public digest_provider {
public:
  bool digest(const std::string& path, std::string& out) override;
};

/* true if value is 64 lowercase hex characters */
bool is_valid_digest(const std::string& value);

outcome apply_action(action what,
                     const std::string& path,
                     attribute_store& store,
                     digest_provider& digester,
                     run_context& ctx);

struct candidate_file {
  std::string path;
  off_t size;
};

typedef std::function<bool(const std::string& path,
                           const struct stat& st)> file_predicate;
file_predicate is_regular_file();
file_predicate is_directory();
file_predicate is_non_empty();
file_predicate on_device(dev_t dev);
/* regular, non-empty, and on the same filesystem as the root */
std::vector<file_predicate> default_filters(dev_t root_dev);
/* directories worth walking into: those that don't cross a mount */
std::vector<file_predicate> descend_filters(dev_t root_dev);
bool passes_all(const std::vector<file_predicate>& filters,
                const std::string& path,
                const struct stat& st);

enum class target_kind { missing, file, directory };
/* stat()s path into st; anything other than a directory or regular file
   counts as missing */
target_kind classify_target(const std::string& path, struct stat& st);
/* Calls visit for every candidate file under target, in traversal order.
   root_st is the target's stat as filled in by classify_target. */
void select_files(const std::string& target,
                  const struct stat& root_st,
                  const std::function<void(const candidate_file&)>& visit);

/* the exit status for the whole run */
int run(action what,
        const std::string& target,
        attribute_store& store,
        digest_provider& digester,
        run_context& ctx);

struct options {
  std::string name;
  action what = action::check;
  int action_count = 0;
  bool verbose = false, dry_run = false, help = false;
  std::string path;
};
void print_usage(std::ostream& out, const std::string& name);
/* true if the command line makes sense; problems are described on err */
bool parse_command_line(int argc, char* argv[], options& opts,
                        std::ostream& err);

#endif
