#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/hash_embedder.hpp"
#include "../include/ingest.hpp"
#include "../include/logging.hpp"
#include "../include/mailbox.hpp"
#include "../include/ollama.hpp"
#include "../include/retrieval.hpp"
#include "../include/storage.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

static std::atomic<bool> g_stop {false};

static void on_signal(int) {
    g_stop = true;
}

static void usage() {
    std::cerr << "mail_rag usage:\n"
              << "  ingest --mailbox <file.json> [--since ISO] [--match term]... [--query q]... [--max N] [--no-summarize]\n"
              << "  watch  --mailbox <file.json> [ingest flags] [--interval-s N] [--once]\n"
              << "  search --question \"...\" [--top-k N]\n"
              << "  query  --question \"...\" [--top-k N]\n"
              << "  status\n"
              << "global: [--backend index|database] [--db <file>] [--index <file>] [--dim N]\n"
              << "        [--embedder ollama|hash] [--ollama <url>] [--embed-model <name>] [--llm <name>]\n"
              << "        [--log-level trace|debug|info|warn|error]\n";
}

struct CliArgs {
    Config cfg;
    std::string mailbox;
    std::string since;
    std::vector<std::string> matches;
    std::vector<std::string> queries;
    std::string question;
    int interval_s {300};
    bool once {false};
};

static CliArgs parse_args(int argc, char** argv) {
    CliArgs a;
    a.cfg = load_config_from_env();
    for (int i = 2; i < argc; ++i) {
        std::string f = argv[i];
        bool has = i + 1 < argc;
        if (f == "--backend" && has) a.cfg.storage.kind = parse_storage_kind(argv[++i]);
        else if (f == "--db" && has) a.cfg.storage.db_path = argv[++i];
        else if (f == "--index" && has) a.cfg.storage.index_path = argv[++i];
        else if (f == "--dim" && has) a.cfg.storage.dimension = (std::size_t)std::stoul(argv[++i]);
        else if (f == "--embedder" && has) a.cfg.embed.provider = argv[++i];
        else if (f == "--ollama" && has) a.cfg.embed.ollama_url = a.cfg.llm.ollama_url = argv[++i];
        else if (f == "--embed-model" && has) a.cfg.embed.embed_model = argv[++i];
        else if (f == "--llm" && has) a.cfg.llm.llm_model = argv[++i];
        else if (f == "--log-level" && has) a.cfg.log_level = argv[++i];
        else if (f == "--top-k" && has) a.cfg.top_k = std::stoi(argv[++i]);
        else if (f == "--mailbox" && has) a.mailbox = argv[++i];
        else if (f == "--since" && has) a.since = argv[++i];
        else if (f == "--match" && has) a.matches.push_back(argv[++i]);
        else if (f == "--query" && has) a.queries.push_back(argv[++i]);
        else if (f == "--max" && has) a.cfg.max_records = std::stoi(argv[++i]);
        else if (f == "--no-summarize") a.cfg.llm.summarize = false;
        else if (f == "--question" && has) a.question = argv[++i];
        else if (f == "--interval-s" && has) a.interval_s = std::stoi(argv[++i]);
        else if (f == "--once") a.once = true;
        else throw std::invalid_argument("unknown or incomplete flag: " + f);
    }
    if (a.cfg.storage.dimension == 0) throw std::invalid_argument("--dim must be > 0");
    return a;
}

static std::shared_ptr<Embedder> make_embedder(const Config& cfg) {
    if (cfg.embed.provider == "hash") {
        spdlog::warn("using the hash embedder: rankings are reproducible but not semantic");
        return std::make_shared<HashEmbedder>(cfg.storage.dimension);
    }
    if (cfg.embed.provider == "ollama") return std::make_shared<OllamaEmbedder>(cfg.embed);
    throw std::invalid_argument("unknown embedder: " + cfg.embed.provider);
}

static IngestOptions ingest_options(const CliArgs& a) {
    IngestOptions opts;
    opts.window = month_to_date_window(Clock::now());
    if (!a.since.empty()) {
        auto t = parse_iso8601(a.since);
        if (!t) throw std::invalid_argument("--since is not an ISO-8601 date: " + a.since);
        opts.window.start = *t;
    }
    opts.queries = a.queries;
    if (!a.matches.empty()) opts.relevance = make_term_filter(a.matches);
    opts.max_records = a.cfg.max_records;
    return opts;
}

static void print_report(const IngestionReport& r) {
    std::cout << "[OK] candidates=" << r.candidates << " inserted=" << r.inserted
              << " duplicates=" << r.duplicates << " filtered=" << r.filtered_out
              << " failures=" << r.failures << (r.truncated ? " (max reached)" : "")
              << (r.cancelled ? " (cancelled)" : "") << "\n";
    std::cout << "     checkpoint=" << format_iso8601(r.checkpoint)
              << (r.checkpoint_advanced ? " (advanced)" : "") << "\n";
    for (const auto& e : r.errors) std::cerr << "  - " << e << "\n";
}

static int run_ingest(const CliArgs& a, StorageBackend& storage, bool watch) {
    if (a.mailbox.empty()) { usage(); return 2; }
    auto embedder = make_embedder(a.cfg);
    check_embedding_dimension(*embedder, storage.dimension());
    std::shared_ptr<Summarizer> summarizer;
    if (a.cfg.llm.summarize) summarizer = std::make_shared<OllamaSummarizer>(a.cfg.llm);
    IngestionPipeline pipeline(storage, std::make_shared<JsonMailboxSource>(a.mailbox), embedder, summarizer,
                               PipelineConfig{storage.dimension(), a.cfg.max_summary_chars});

    if (!watch) {
        print_report(pipeline.run(ingest_options(a), &g_stop));
        return 0;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    spdlog::info("watching {} every {}s{}", a.mailbox, a.interval_s, a.once ? " (once)" : "");
    do {
        try {
            print_report(pipeline.run(ingest_options(a), &g_stop));
        } catch (const FetchFailure& e) {
            spdlog::error("ingest run aborted: {}", e.what());
        }
        for (int s = 0; s < a.interval_s && !g_stop && !a.once; ++s) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    } while (!a.once && !g_stop);
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    try {
        auto a = parse_args(argc, argv);
        init_logging(a.cfg.log_level, a.cfg.log_file);

        if (cmd != "ingest" && cmd != "watch" && cmd != "search" && cmd != "query" && cmd != "status") {
            usage();
            return 1;
        }
        auto storage = make_storage(a.cfg.storage);

        if (cmd == "ingest" || cmd == "watch") {
            return run_ingest(a, *storage, cmd == "watch");
        } else if (cmd == "search" || cmd == "query") {
            if (a.question.empty()) { usage(); return 2; }
            auto embedder = make_embedder(a.cfg);
            check_embedding_dimension(*embedder, storage->dimension());
            Retriever retriever(*storage, embedder, storage->dimension(), a.cfg.top_k);
            if (cmd == "search") {
                int i = 1;
                for (const auto& s : retriever.retrieve(a.question)) {
                    std::cout << "[" << i++ << "] " << s << "\n\n";
                }
                return 0;
            }
            OllamaChat chat(a.cfg.llm);
            SessionConfig sc;
            sc.item_label = "Email";
            ConversationSession session(retriever, chat, sc);
            std::cout << "\n==== Answer ====\n\n" << session.ask(a.question) << "\n\n";
            return 0;
        } else {
            auto r = storage->audit();
            std::cout << "[OK] backend=" << storage->name() << " dim=" << storage->dimension() << "\n"
                      << "     records=" << storage->count() << " vectors=" << r.vectors << "\n"
                      << "     checkpoint=" << format_iso8601(storage->get_checkpoint()) << "\n"
                      << "     audit=" << (r.clean() ? "clean" : "inconsistent")
                      << " orphan_vectors=" << r.orphan_vectors << " missing_vectors=" << r.missing_vectors << "\n";
            return r.clean() ? 0 : 3;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
