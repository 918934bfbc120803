// Operator tool: seed the local object store and print share links and the
// DNS records of a custom domain.

#include "access.hpp"
#include "logging.hpp"
#include "rocks_store.hpp"
#include "routing.hpp"

#include <boost/program_options.hpp>

#include <rocksdb/db.h>
#include <rocksdb/options.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

// Largest character-string of a TXT record.
constexpr std::size_t kTxtStringMax = 255;

void PrintUsage(const char* prog, const po::options_description& desc) {
  std::cerr << "Usage: " << prog << " <command> [options]\n";
  std::cerr << "Commands:\n";
  std::cerr << "  mkbucket --project id --bucket name\n";
  std::cerr << "  put --project id --bucket name --key key --file path [--content-type type]\n";
  std::cerr << "  share --project id [--bucket name]... [--expires unix] [--path bucket/key]\n";
  std::cerr << "  dns --host name --access serialized --root bucket[/prefix]\n";
  std::cerr << desc << "\n";
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return !file.bad();
}

std::unique_ptr<rocksdb::DB> OpenDb(const std::string& path) {
  rocksdb::Options opt;
  opt.create_if_missing = true;
  rocksdb::DB* raw = nullptr;
  auto st = rocksdb::DB::Open(opt, path, &raw);
  if (!st.ok()) {
    logging::get()->error("failed to open RocksDB at {}: {}", path, st.ToString());
    return nullptr;
  }
  return std::unique_ptr<rocksdb::DB>(raw);
}

// "storj-access:<value>" lines, split into numbered parts when too long.
std::vector<std::string> TxtLines(const std::string& key, const std::string& value) {
  std::vector<std::string> lines;
  const std::string single = key + ":" + value;
  if (single.size() <= kTxtStringMax) {
    lines.push_back(single);
    return lines;
  }
  std::size_t pos = 0;
  for (int part = 1; pos < value.size(); ++part) {
    const std::string tag = key + "-" + std::to_string(part) + ":";
    const std::size_t n = std::min(kTxtStringMax - tag.size(), value.size() - pos);
    lines.push_back(tag + value.substr(pos, n));
    pos += n;
  }
  return lines;
}

} // namespace

int main(int argc, char** argv) {
  std::string command;
  std::string db_path = "./linksharing_rocksdb";
  std::string project;
  std::vector<std::string> buckets;
  std::string key;
  std::string file;
  std::string content_type;
  long long expires = 0;
  std::string path;
  std::string public_url = "http://localhost:8080";
  std::string host;
  std::string access;
  std::string root;
  std::string txt_prefix = "txt-";

  po::options_description desc("linksharing_ctl options");
  desc.add_options()
    ("help,h", "Show help")
    ("command", po::value<std::string>(&command), "mkbucket | put | share | dns")
    ("db-path", po::value<std::string>(&db_path)->default_value(db_path), "RocksDB path")
    ("project", po::value<std::string>(&project), "Project id")
    ("bucket", po::value<std::vector<std::string>>(&buckets), "Bucket; repeat to restrict a share")
    ("key", po::value<std::string>(&key), "Object key")
    ("file", po::value<std::string>(&file), "File to upload")
    ("content-type", po::value<std::string>(&content_type), "Content type; guessed from the key when empty")
    ("expires", po::value<long long>(&expires)->default_value(expires), "Share expiry (unix seconds, 0: never)")
    ("path", po::value<std::string>(&path), "bucket[/key] to build a share URL for")
    ("public-url", po::value<std::string>(&public_url)->default_value(public_url), "Public URL base of the gateway")
    ("host", po::value<std::string>(&host), "Custom domain")
    ("access", po::value<std::string>(&access), "Serialized access grant or access key id")
    ("root", po::value<std::string>(&root), "Storage root bucket[/prefix]")
    ("txt-record-prefix", po::value<std::string>(&txt_prefix)->default_value(txt_prefix), "Prefix of the TXT name");

  po::positional_options_description pos;
  pos.add("command", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
    po::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << "Argument error: " << e.what() << "\n";
    PrintUsage(argv[0], desc);
    return 2;
  }

  if (vm.count("help")) {
    PrintUsage(argv[0], desc);
    return 0;
  }
  if (command.empty()) {
    PrintUsage(argv[0], desc);
    return 2;
  }

  if (command == "mkbucket" || command == "put") {
    if (project.empty() || buckets.size() != 1) {
      std::cerr << command << " needs --project and exactly one --bucket\n";
      return 2;
    }
    auto db = OpenDb(db_path);
    if (!db) return 1;
    storage::RocksObjectStore store(db.get());
    std::string err;

    if (command == "mkbucket") {
      if (!store.create_bucket(project, buckets[0], &err)) {
        std::cerr << "create bucket failed: " << err << "\n";
        return 1;
      }
      std::cout << "bucket " << buckets[0] << " ready\n";
      return 0;
    }

    if (key.empty() || file.empty()) {
      std::cerr << "put needs --key and --file\n";
      return 2;
    }
    std::string data;
    if (!ReadFile(file, &data)) {
      std::cerr << "cannot read " << file << "\n";
      return 1;
    }
    storage::ObjectMeta meta;
    if (!store.put_object(project, buckets[0], key, data, content_type, &meta, &err)) {
      std::cerr << "put failed: " << err << "\n";
      return 1;
    }
    std::cout << key << " " << meta.size << " bytes etag=" << meta.etag
              << " content-type=" << meta.content_type << "\n";
    return 0;
  }

  if (command == "share") {
    if (project.empty()) {
      std::cerr << "share needs --project\n";
      return 2;
    }
    storage::Access grant;
    grant.project = project;
    grant.buckets = buckets;
    grant.expires = expires;
    const std::string serialized = storage::serialize_access(grant);
    std::cout << serialized << "\n";

    if (!path.empty()) {
      routing::UrlBase base;
      std::string err;
      if (!routing::parse_url_base(public_url, &base, &err)) {
        std::cerr << "invalid --public-url: " << err << "\n";
        return 2;
      }
      std::cout << routing::make_location(base, serialized + "/" + path) << "\n";
    }
    return 0;
  }

  if (command == "dns") {
    if (host.empty() || access.empty() || root.empty()) {
      std::cerr << "dns needs --host, --access and --root\n";
      return 2;
    }
    const std::string name = txt_prefix + host;
    for (const auto& line : TxtLines("storj-access", access)) {
      std::cout << name << "\tIN\tTXT\t\"" << line << "\"\n";
    }
    for (const auto& line : TxtLines("storj-root", root)) {
      std::cout << name << "\tIN\tTXT\t\"" << line << "\"\n";
    }
    std::cout << host << "\tIN\tCNAME\t<gateway host>\n";
    return 0;
  }

  std::cerr << "unknown command " << command << "\n";
  PrintUsage(argv[0], desc);
  return 2;
}
