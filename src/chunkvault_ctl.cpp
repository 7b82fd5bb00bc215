// Command-line front end for a ChunkVault store kept under var_dir.
//
// Each invocation loads the configuration and the metadata snapshot, runs one
// command against directory-backed storage nodes and writes the snapshot back.

#include "cluster/node_registry.h"
#include "files/file_assembler.h"
#include "files/file_service.h"
#include "files/version_manager.h"
#include "node/directory_object_store.hpp"
#include "placement/placement_planner.h"
#include "repair/ChunkVerifier.h"
#include "replication/replication_coordinator.h"
#include "storage/errors.h"
#include "storage/memory_metadata_repository.h"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <vector>

using namespace chunkvault;

namespace {

struct Args {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  bool has(const std::string &flag) const { return options.count(flag) > 0; }
  std::string get(const std::string &flag, const std::string &def = "") const {
    auto it = options.find(flag);
    return it == options.end() ? def : it->second;
  }
};

// "--flag value" pairs become options, except the boolean flags listed here.
Args parseArgs(int argc, char **argv, int first) {
  static const std::vector<std::string> booleanFlags = {"--all"};
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      bool isBool = std::find(booleanFlags.begin(), booleanFlags.end(), arg) !=
                    booleanFlags.end();
      if (isBool || i + 1 >= argc) {
        args.options[arg] = "";
      } else {
        args.options[arg] = argv[++i];
      }
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

std::string formatTime(std::time_t t) {
  if (t == 0) {
    return "-";
  }
  char buf[32];
  std::tm tm{};
  localtime_r(&t, &tm);
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

void printUsage() {
  std::cout
      << "Usage: chunkvault_ctl <command> [args]\n"
      << "  node add <name> <dir|-> <capacity>\n"
      << "  node list [--all] | node heartbeat <id> | node remove <id>\n"
      << "  node reconcile | node check\n"
      << "  upload <path> [--owner O] [--name N] [--chunk-size N] "
         "[--replicas R] [--type T]\n"
      << "  download <fileId> <out>\n"
      << "  verify <chunkId> | verify-file <fileId> | verify-all\n"
      << "  ls [--owner O] [--all] | chunks <fileId>\n"
      << "  rm <fileId> | undelete <fileId> | gc <fileId> | purge <fileId>\n"
      << "  version snapshot <fileId> [--note N] [--actor A]\n"
      << "  version list <fileId> | version restore <versionId>\n"
      << "  metrics\n";
}

void need(const Args &args, size_t count, const std::string &usage) {
  if (args.positional.size() < count) {
    throw InvalidInputError("usage: chunkvault_ctl " + usage);
  }
}

void printFile(const File &f) {
  std::cout << f.id << '\t' << f.name << '\t' << humanReadableSize(f.size)
            << '\t' << (f.owner.empty() ? "-" : f.owner) << '\t'
            << fileCategory(f) << '\t' << (f.isDeleted ? "deleted" : "live")
            << '\t' << f.checksum << std::endl;
}

void printStats(const CollectionStats &stats) {
  std::cout << "Collected " << stats.chunksCollected << " replicas ("
            << stats.objectsRemoved << " objects removed, "
            << stats.objectsMissing << " already missing, "
            << stats.objectsFailed << " unreachable), reclaimed "
            << humanReadableSize(stats.bytesReclaimed) << std::endl;
}

struct Store {
  explicit Store(const StorageConfig &cfg)
      : config(cfg), client(std::make_shared<DirectoryObjectStore>()),
        registry(repo, config), planner(repo),
        coordinator(repo, registry, planner, client, config),
        assembler(repo, registry, client, config),
        verifier(repo, registry, client), versions(repo),
        files(repo, registry, coordinator, client, config) {}

  StorageConfig config;
  MemoryMetadataRepository repo;
  std::shared_ptr<DirectoryObjectStore> client;
  NodeRegistry registry;
  GreedyCapacityPlanner planner;
  ReplicationCoordinator coordinator;
  FileAssembler assembler;
  ChunkVerifier verifier;
  VersionManager versions;
  FileService files;
};

int nodeCommand(Store &store, const Args &args) {
  need(args, 1, "node <add|list|heartbeat|remove|reconcile|check>");
  const std::string &sub = args.positional[0];
  if (sub == "add") {
    need(args, 4, "node add <name> <dir|-> <capacity>");
    std::string dir = args.positional[2] == "-"
                          ? nodeDataDir(args.positional[1])
                          : args.positional[2];
    std::filesystem::create_directories(dir);
    StorageNode n = store.registry.registerNode(
        args.positional[1], std::filesystem::absolute(dir).string(), 0,
        parseByteSize(args.positional[3]));
    std::cout << n.id << std::endl;
    return 0;
  }
  if (sub == "list") {
    std::cout << "Id\tName\tAddress\tAvailable\tCapacity\tActive\tHealth\t"
                 "LastHeartbeat"
              << std::endl;
    for (const auto &n : store.registry.listNodes(args.has("--all"))) {
      std::cout << n.id << '\t' << n.name << '\t' << n.address() << '\t'
                << humanReadableSize(n.available) << '\t'
                << humanReadableSize(n.capacity) << '\t'
                << (n.isActive ? "yes" : "no") << '\t'
                << nodeStateName(store.registry.health().state(n.id)) << '\t'
                << formatTime(n.lastHeartbeat) << std::endl;
    }
    return 0;
  }
  if (sub == "heartbeat") {
    need(args, 2, "node heartbeat <id>");
    store.registry.heartbeat(args.positional[1]);
    return 0;
  }
  if (sub == "remove") {
    need(args, 2, "node remove <id>");
    NodeRemoval r = store.registry.removeNode(args.positional[1]);
    std::cout << (r == NodeRemoval::Deleted
                      ? "Node removed"
                      : "Node still owns chunks; deactivated instead")
              << std::endl;
    return r == NodeRemoval::Deleted ? 0 : 3;
  }
  if (sub == "reconcile") {
    store.registry.reconcileAll();
    return 0;
  }
  if (sub == "check") {
    for (const auto &id : store.registry.checkForDeadNodes(std::time(nullptr))) {
      std::cout << "Deactivated " << id << std::endl;
    }
    return 0;
  }
  throw InvalidInputError("Unknown node command: " + sub);
}

int versionCommand(Store &store, const Args &args) {
  need(args, 2, "version <snapshot|list|restore> <id>");
  const std::string &sub = args.positional[0];
  if (sub == "snapshot") {
    FileVersion v = store.versions.snapshot(
        args.positional[1], args.get("--note"),
        args.get("--actor", std::getenv("USER") ? std::getenv("USER") : ""));
    std::cout << v.id << "\tv" << v.versionNumber << std::endl;
    return 0;
  }
  if (sub == "list") {
    for (const auto &v : store.versions.listVersions(args.positional[1])) {
      std::cout << v.id << "\tv" << v.versionNumber << '\t'
                << humanReadableSize(v.size) << '\t' << v.checksum << '\t'
                << formatTime(v.createdAt) << '\t'
                << (v.createdBy.empty() ? "-" : v.createdBy) << '\t'
                << v.notes << std::endl;
    }
    return 0;
  }
  if (sub == "restore") {
    File f = store.versions.restore(args.positional[1]);
    printFile(f);
    return 0;
  }
  throw InvalidInputError("Unknown version command: " + sub);
}

int dispatch(Store &store, const std::string &cmd, const Args &args) {
  if (cmd == "node") {
    return nodeCommand(store, args);
  }
  if (cmd == "version") {
    return versionCommand(store, args);
  }
  if (cmd == "upload") {
    need(args, 1, "upload <path>");
    const std::string &path = args.positional[0];
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
      throw InvalidInputError("Cannot open " + path);
    }
    UploadRequest req;
    req.name = args.get("--name",
                        std::filesystem::path(path).filename().string());
    req.owner = args.get("--owner");
    req.contentType = args.get("--type");
    if (args.has("--chunk-size"))
      req.chunkSize = parseByteSize(args.get("--chunk-size"));
    if (args.has("--replicas"))
      req.replicationFactor = static_cast<unsigned int>(parseUnsigned(
          args.get("--replicas"), std::numeric_limits<unsigned int>::max()));
    UploadResult res = store.files.upload(in, req);
    std::cout << res.file.id << (res.deduplicated ? "\t(existing)" : "")
              << (res.reducedDurability ? "\t(reduced durability)" : "")
              << std::endl;
    return 0;
  }
  if (cmd == "download") {
    need(args, 2, "download <fileId> <out>");
    std::ofstream out(args.positional[1], std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw InvalidInputError("Cannot open " + args.positional[1]);
    }
    try {
      uint64_t n = store.assembler.read(args.positional[0], out);
      std::cout << "Wrote " << humanReadableSize(n) << std::endl;
    } catch (const StorageError &) {
      out.close();
      std::filesystem::remove(args.positional[1]);
      throw;
    }
    return 0;
  }
  if (cmd == "verify") {
    need(args, 1, "verify <chunkId>");
    bool ok = store.verifier.verify(args.positional[0]);
    std::cout << (ok ? "OK" : "CORRUPTED") << std::endl;
    return ok ? 0 : 3;
  }
  if (cmd == "verify-file") {
    need(args, 1, "verify-file <fileId>");
    size_t bad = store.verifier.verifyFile(args.positional[0]);
    std::cout << bad << " corrupted replicas" << std::endl;
    return bad == 0 ? 0 : 3;
  }
  if (cmd == "verify-all") {
    ChunkVerifier::Summary s = store.verifier.verifyAll();
    std::cout << s.checked << " checked, " << s.corrupted << " corrupted, "
              << s.unavailable << " unreachable" << std::endl;
    return s.corrupted == 0 ? 0 : 3;
  }
  if (cmd == "ls") {
    for (const auto &f :
         store.files.listFiles(args.get("--owner"), args.has("--all"))) {
      printFile(f);
    }
    return 0;
  }
  if (cmd == "chunks") {
    need(args, 1, "chunks <fileId>");
    for (const auto &c : store.files.chunksOf(args.positional[0])) {
      std::cout << c.ordinal << '\t' << c.id << '\t' << c.nodeId << '\t'
                << c.size << '\t' << chunkStatusToString(c.status) << '\t'
                << (c.isPrimary ? "primary" : "replica") << '\t'
                << (c.lastVerifiedAt ? formatTime(*c.lastVerifiedAt) : "-")
                << std::endl;
    }
    return 0;
  }
  if (cmd == "rm") {
    need(args, 1, "rm <fileId>");
    store.files.softDelete(args.positional[0]);
    return 0;
  }
  if (cmd == "undelete") {
    need(args, 1, "undelete <fileId>");
    store.files.undelete(args.positional[0]);
    return 0;
  }
  if (cmd == "gc") {
    need(args, 1, "gc <fileId>");
    printStats(store.files.collectGarbage(args.positional[0]));
    return 0;
  }
  if (cmd == "purge") {
    need(args, 1, "purge <fileId>");
    printStats(store.files.purge(args.positional[0]));
    return 0;
  }
  if (cmd == "metrics") {
    for (const auto &n : store.registry.listNodes(true)) {
      store.registry.publishCapacity(n.id);
    }
    std::cout << MetricsRegistry::instance().toPrometheus();
    return 0;
  }
  printUsage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    printUsage();
    return 1;
  }

  StorageConfig config;
  try {
    config = loadConfigFromEnvironment();
  } catch (const StorageError &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 2;
  }
  setVarDir(config.varDir);

  try {
    std::filesystem::create_directories(logsDir());
    Logger::init(logsDir() + "/chunkvault_ctl.log", config.logLevel,
                 config.logMaxFileSize, config.logMaxBackups);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 2;
  }

  Store store(config);
  try {
    store.repo.loadSnapshot(metadataSnapshotPath());
  } catch (const StorageError &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 2;
  }

  int rc = 1;
  std::string cmd = argv[1];
  try {
    rc = dispatch(store, cmd, parseArgs(argc, argv, 2));
  } catch (const StorageError &e) {
    std::cerr << "error [" << errorCodeName(e.code()) << "]: " << e.what()
              << std::endl;
    rc = 1;
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    Logger::getInstance().log(LogLevel::ERROR,
                              "[chunkvault_ctl] " + cmd + ": " + e.what());
    rc = 1;
  }

  try {
    store.repo.saveSnapshot(metadataSnapshotPath());
  } catch (const std::exception &e) {
    std::cerr << "FATAL: could not save metadata: " << e.what() << std::endl;
    return 2;
  }
  return rc;
}
