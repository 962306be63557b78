#ifndef OPTIONS_H
#define OPTIONS_H

#include <string>

struct Options {
  std::string manifest_path;
  std::string fsname;
  int http_timeout_ms;
  int max_redirects;
  bool probe_size;
  double attr_timeout_sec;

  Options()
      : manifest_path(""), fsname("urlfs"), http_timeout_ms(5000),
        max_redirects(10), probe_size(true), attr_timeout_sec(1.0) {}
};

#endif // OPTIONS_H
