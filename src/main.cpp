// main.cpp: rfloc_cli, ölçüm dosyası/simülasyon -> kaynak tespiti, JSON rapor, ısı haritası
#include "rfloc/config.hpp"
#include "rfloc/config_file.hpp"
#include "rfloc/csv_source.hpp"
#include "rfloc/dummy_source.hpp"
#include "rfloc/heatmap.hpp"
#include "rfloc/interference_locator.hpp"
#include "rfloc/report.hpp"
#include "rfloc/utils.hpp"

#include <opencv2/core.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

// ------------------------------------------------------------
// Basit CLI
struct CliOptions {
    std::string csv_path;
    std::string config_path;
    std::string out_json;
    std::string out_heatmap;
    size_t      simulate = 0;   // >0: simüle edilmiş tarama
};

static void print_help() {
    std::puts(
"Usage: rfloc_cli [options]\n"
"\n"
" Input:\n"
"       --csv <file>          measurements, one 'x,y,rssi_dbm,freq_mhz' per line\n"
"       --simulate <int>      generate a simulated survey with N samples\n"
"       --config <file>       settings file (YAML/JSON/XML)\n"
"\n"
" Path loss model:\n"
"   -e, --exponent <dbl>      path loss exponent (default 2.0, indoor 3-4)\n"
"       --ref-dist <dbl>      reference distance in m (default 1.0)\n"
"       --ref-rssi <dbl>      RSSI at reference distance in dBm (default -40)\n"
"\n"
" Analysis:\n"
"       --bandwidth <dbl>     clustering resolution in MHz (default 20)\n"
"   -g, --grid <int>          heatmap grid size (default 50)\n"
"\n"
" Output:\n"
"   -o, --out <file>          write JSON report\n"
"       --heatmap <file>      write heatmap grid as CSV\n"
"   -q, --quiet               no progress logging\n"
    );
}

static bool parse_cli(int argc, char** argv, CliOptions& o, rfloc::Params& p) {
    // Önce ayar dosyası: komut satırı değerleri onu ezer
    for (int i=1; i<argc-1; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            o.config_path = argv[i+1];
            if (!rfloc::load_params(o.config_path, p)) return false;
        }
    }
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* what){
            if (i+1 >= argc) { std::fprintf(stderr,"missing value for %s\n", what); return false; }
            return true;
        };
        if (a=="-h" || a=="--help") { print_help(); return false; }
        else if (a=="--csv")                 { if(!need(a.c_str())) return false; o.csv_path    = argv[++i]; }
        else if (a=="--simulate")            { if(!need(a.c_str())) return false; o.simulate    = std::strtoul(argv[++i], nullptr, 10); }
        else if (a=="--config")              { if(!need(a.c_str())) return false; ++i; }
        else if (a=="-e"||a=="--exponent")   { if(!need(a.c_str())) return false; p.path_loss_exponent = std::strtod(argv[++i], nullptr); }
        else if (a=="--ref-dist")            { if(!need(a.c_str())) return false; p.reference_distance = std::strtod(argv[++i], nullptr); }
        else if (a=="--ref-rssi")            { if(!need(a.c_str())) return false; p.reference_rssi     = std::strtod(argv[++i], nullptr); }
        else if (a=="--bandwidth")           { if(!need(a.c_str())) return false; p.cluster_bandwidth  = std::strtod(argv[++i], nullptr); }
        else if (a=="-g"||a=="--grid")       { if(!need(a.c_str())) return false; p.grid_size   = std::atoi(argv[++i]); }
        else if (a=="-o"||a=="--out")        { if(!need(a.c_str())) return false; o.out_json    = argv[++i]; }
        else if (a=="--heatmap")             { if(!need(a.c_str())) return false; o.out_heatmap = argv[++i]; }
        else if (a=="-q"||a=="--quiet")      { p.verbose = false; }
        else { std::fprintf(stderr, "unknown option: %s\n", a.c_str()); print_help(); return false; }
    }
    if (o.csv_path.empty() && o.simulate == 0) {
        std::fprintf(stderr, "no input: use --csv <file> or --simulate <n>\n");
        return false;
    }
    return true;
}

static void print_source(size_t idx, const rfloc::InterferenceSource& s) {
    std::printf("\n[%zu] %s\n", idx, s.source_id.c_str());
    std::printf("    Type:      %s (%s)\n", rfloc::label(s.type), rfloc::to_string(s.type));
    std::printf("    Severity:  %s (%d/100)\n", rfloc::to_string(s.severity), s.severity_score());
    std::printf("    Frequency: %.1f - %.1f MHz\n", s.frequency_range.first, s.frequency_range.second);
    std::printf("    Power:     %.1f dBm  (%u samples)\n", s.avg_power, s.detection_count);
    std::printf("    Seen:      %s .. %s\n",
                rfloc::format_local(s.first_detected, "%H:%M:%S").c_str(),
                rfloc::format_local(s.last_detected,  "%H:%M:%S").c_str());

    std::string chs;
    for (auto ch : s.affected_channels) chs += (chs.empty() ? "" : ", ") + std::to_string(ch);
    std::printf("    Channels:  [%s]\n", chs.c_str());

    if (s.location)
        std::printf("    Location:  (%.2f, %.2f) m, confidence %.1f%%\n",
                    s.location->x, s.location->y, s.location_confidence * 100.0);
    else
        std::printf("    Location:  unavailable\n");

    std::printf("    Mitigation:\n");
    for (const auto& m : s.mitigation_strategies) std::printf("      - %s\n", m.c_str());
}

// ------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc == 1) { print_help(); return 0; }

    rfloc::Params p;
    CliOptions o;
    if (!parse_cli(argc, argv, o, p)) return 1;

    const rfloc::LocatorConfig lcfg = rfloc::to_locator_config(p);

    try {
        rfloc::InterferenceLocator loc(lcfg);

        // Ölçümleri yükle
        size_t n = 0;
        if (!o.csv_path.empty()) {
            rfloc::CsvSource src(o.csv_path, p.verbose);
            if (!src.ok()) return 1;
            n += rfloc::feed(src, loc);
            if (p.verbose)
                std::printf("[INFO] %zu measurements from %s (%zu skipped)\n",
                            n, o.csv_path.c_str(), src.skipped());
        }
        if (o.simulate > 0) {
            // İki verici: mikrodalga benzeri 2.45 GHz ve 5 GHz ofis AP'si
            rfloc::DummySource sim(o.simulate,
                                   {{3.0, 4.0, 2450.0, 12.0}, {8.0, 2.0, 5180.0, 0.0}},
                                   lcfg.path_loss);
            const size_t k = rfloc::feed(sim, loc);
            n += k;
            if (p.verbose) std::printf("[SIM] %zu simulated measurements\n", k);
        }

        const auto sources = loc.detect_interference_sources();

        std::printf("\n%zu measurement points, %zu interference sources\n", n, sources.size());
        std::puts("================================================================================");
        for (size_t i = 0; i < sources.size(); ++i) print_source(i + 1, sources[i]);

        // Isı haritası
        const rfloc::HeatmapGrid grid = loc.heatmap(p.grid_size);
        if (!grid.values.empty()) {
            double vmin = 0.0, vmax = 0.0;
            cv::minMaxLoc(grid.values, &vmin, &vmax);
            std::puts("\n================================================================================");
            std::printf("Heatmap %dx%d over x=[%.2f, %.2f] y=[%.2f, %.2f] m\n",
                        grid.values.cols, grid.values.rows,
                        grid.bounds.x_min, grid.bounds.x_max, grid.bounds.y_min, grid.bounds.y_max);
            std::printf("Max interference: %.1f  Min interference: %.1f\n", vmax, vmin);
        }

        bool io_ok = true;
        if (!o.out_heatmap.empty()) {
            io_ok = rfloc::write_csv(grid, o.out_heatmap) && io_ok;
            if (io_ok && p.verbose) std::printf("[INFO] Heatmap written to %s\n", o.out_heatmap.c_str());
        }
        if (!o.out_json.empty()) {
            const bool ok = rfloc::write_report(loc, o.out_json);
            if (ok && p.verbose) std::printf("[INFO] Report written to %s\n", o.out_json.c_str());
            io_ok = ok && io_ok;
        }
        return io_ok ? 0 : 1;

    } catch (const rfloc::InvalidConfig& e) {
        std::cerr << "[ERR] Invalid configuration: " << e.what() << "\n";
        return 1;
    }
}
