#include "auth_service.hpp"
#include "dns_client.hpp"
#include "handler.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "rocks_store.hpp"
#include "routing.hpp"
#include "txt_records.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

int main(int argc, char** argv) {
  std::string config_path;
  std::string address = "0.0.0.0:8080";
  std::string public_url = "http://localhost:8080";
  std::string db_path = "./linksharing_rocksdb";
  int threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  int cache_mb = 256;
  long request_timeout_ms = 30000;
  long idle_timeout_s = 60;
  long txt_ttl_s = 3600;
  std::string txt_prefix = "txt-";
  bool txt_require_public = false;
  std::string dns_server;
  long dns_timeout_ms = 5000;
  std::string auth_url;
  std::string auth_token;
  long auth_timeout_ms = 5000;
  std::string log_level = "info";

  po::options_description desc("linksharing options");
  desc.add_options()
    ("help,h", "Show help")
    ("config", po::value<std::string>(&config_path), "INI style config file; command line values win")
    ("address", po::value<std::string>(&address)->default_value(address), "Listen address host:port")
    ("public-url", po::value<std::string>(&public_url)->default_value(public_url), "Public URL base of the gateway")
    ("db-path", po::value<std::string>(&db_path)->default_value(db_path), "RocksDB path")
    ("cache-mb", po::value<int>(&cache_mb)->default_value(cache_mb), "RocksDB block cache (MiB)")
    ("threads", po::value<int>(&threads)->default_value(threads), "Worker threads")
    ("request-timeout-ms", po::value<long>(&request_timeout_ms)->default_value(request_timeout_ms), "Per-request deadline")
    ("idle-timeout", po::value<long>(&idle_timeout_s)->default_value(idle_timeout_s), "Close keep-alive connections idle this long (seconds)")
    ("txt-record-ttl", po::value<long>(&txt_ttl_s)->default_value(txt_ttl_s), "TXT record cache TTL (seconds)")
    ("txt-record-prefix", po::value<std::string>(&txt_prefix)->default_value(txt_prefix), "Prefix of the TXT name looked up per host")
    ("txt-require-public", po::bool_switch(&txt_require_public)->default_value(txt_require_public), "Reject private access key ids in TXT records")
    ("dns-server", po::value<std::string>(&dns_server)->default_value(dns_server), "DNS server ip[:port]; empty uses /etc/resolv.conf")
    ("dns-timeout-ms", po::value<long>(&dns_timeout_ms)->default_value(dns_timeout_ms), "DNS query timeout")
    ("auth-service-base-url", po::value<std::string>(&auth_url)->default_value(auth_url), "Authorization service base URL")
    ("auth-service-token", po::value<std::string>(&auth_token)->default_value(auth_token), "Authorization service bearer token")
    ("auth-service-timeout-ms", po::value<long>(&auth_timeout_ms)->default_value(auth_timeout_ms), "Authorization service timeout")
    ("log-level", po::value<std::string>(&log_level)->default_value(log_level), "trace | debug | info | warn | error | off");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("config")) {
      const std::string path = vm["config"].as<std::string>();
      std::ifstream in(path);
      if (!in) {
        std::cerr << "Cannot open config file " << path << "\n";
        return 2;
      }
      po::store(po::parse_config_file(in, desc), vm);
    }
    po::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << "Argument error: " << e.what() << "\n\n" << desc << "\n";
    return 2;
  }

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }

  if (!logging::init(log_level)) {
    std::cerr << "Unknown --log-level " << log_level << "\n";
    return 2;
  }
  auto log = logging::get();

  auto colon = address.rfind(':');
  if (colon == std::string::npos) {
    std::cerr << "--address must be host:port\n";
    return 2;
  }
  std::string host = address.substr(0, colon);
  int port_i = std::atoi(address.substr(colon + 1).c_str());
  if (port_i <= 0 || port_i > 65535) {
    std::cerr << "Invalid port\n";
    return 2;
  }

  if (request_timeout_ms <= 0 || idle_timeout_s <= 0 || txt_ttl_s < 0 || threads <= 0) {
    std::cerr << "Timeouts and --threads must be positive\n";
    return 2;
  }

  routing::UrlBase url_base;
  std::string url_err;
  if (!routing::parse_url_base(public_url, &url_base, &url_err)) {
    std::cerr << "Invalid --public-url " << public_url << ": " << url_err << "\n";
    return 2;
  }

  // RocksDB options (read-mostly defaults)
  rocksdb::Options opt;
  opt.create_if_missing = true;
  opt.IncreaseParallelism();
  opt.OptimizeLevelStyleCompaction();

  rocksdb::BlockBasedTableOptions table;
  table.block_cache = rocksdb::NewLRUCache(static_cast<size_t>(cache_mb) * 1024u * 1024u);
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
  table.cache_index_and_filter_blocks = true;
  opt.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));

  std::unique_ptr<rocksdb::DB> db;
  rocksdb::DB* raw = nullptr;
  auto st = rocksdb::DB::Open(opt, db_path, &raw);
  if (!st.ok()) {
    log->critical("failed to open RocksDB at {}: {}", db_path, st.ToString());
    return 1;
  }
  db.reset(raw);

  server::Metrics metrics;
  storage::RocksObjectStore store(db.get(), rocksdb::WriteOptions{}, &metrics);
  storage::RocksUplink uplink(&store);

  std::unique_ptr<auth::ServiceClient> auth_client;
  if (!auth_url.empty()) {
    auth::ServiceConfig acfg;
    acfg.base_url = auth_url;
    acfg.token = auth_token;
    acfg.timeout_ms = auth_timeout_ms;
    auth_client = std::make_unique<auth::ServiceClient>(acfg);
  }

  std::unique_ptr<dns::ResolvClient> dns_client;
  try {
    dns_client = std::make_unique<dns::ResolvClient>(dns::ResolvClient::Config{dns_server, dns_timeout_ms});
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid --dns-server " << dns_server << ": " << e.what() << "\n";
    return 2;
  }

  dns::TxtRecords::Config tcfg;
  tcfg.ttl = std::chrono::seconds(txt_ttl_s);
  tcfg.lookup_prefix = txt_prefix;
  tcfg.require_public = txt_require_public;
  dns::TxtRecords txt_records(tcfg, dns_client.get(), auth_client.get(), &metrics);

  routing::Router router(url_base, auth_client.get(), &txt_records);
  sharing::Handler handler(&router, &uplink, &metrics);

  asio::io_context ioc{static_cast<int>(std::max(1, threads))};

  tcp::endpoint endpoint;
  try {
    endpoint = tcp::endpoint{asio::ip::make_address(host), static_cast<unsigned short>(port_i)};
  } catch (const std::exception& e) {
    std::cerr << "Invalid listen host " << host << ": " << e.what() << "\n";
    return 2;
  }

  server::Config scfg;
  scfg.listen_host = host;
  scfg.listen_port = static_cast<unsigned short>(port_i);
  scfg.request_timeout = std::chrono::milliseconds(request_timeout_ms);
  scfg.idle_timeout = std::chrono::seconds(idle_timeout_s);
  scfg.metrics = &metrics;

  std::shared_ptr<server::Listener> listener;
  try {
    listener = std::make_shared<server::Listener>(ioc, endpoint, handler, scfg);
  } catch (const boost::system::system_error& e) {
    log->critical("unable to listen on {}: {}", address, e.what());
    return 1;
  }
  listener->run();

  log->info("linksharing listening on {} public-url={} db={} threads={}",
            address, url_base.to_string(), db_path, threads);
  log->info("custom domains: txt prefix={} ttl={}s require-public={} dns-server={}",
            txt_prefix, txt_ttl_s, txt_require_public, dns_server.empty() ? "system" : dns_server);
  log->info("access key ids: {}", auth_url.empty() ? "disabled" : auth_url);

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&ioc]{ ioc.run(); });
  }

  for (auto& t : workers) t.join();
  return 0;
}
