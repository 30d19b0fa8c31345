#ifndef CTP_CONFIG_HPP
#define CTP_CONFIG_HPP

#include <cstdint>
#include <string_view>

namespace ctp::config {

    // --- DEBUG MODE ---
    // Mettre à true pour activer les logs verbeux (désactiver en production)
    constexpr bool DEBUG_MODE = true;

    // Détaille les N premiers échanges HTTP (0 = tous, très bavard sous charge !)
    constexpr uint32_t DEBUG_FIRST_N_EXCHANGES = 20;

    // --- ARTEFACTS PATHS ---
    // Chemin par défaut si aucun fichier n'est passé en ligne de commande.
    constexpr std::string_view PATH_RULES_CONFIG = "data/rules.yaml";

    // --- PROXY DEFAULTS ---
    // Valeurs utilisées quand le fichier de config ne les précise pas.
    // Elles sont transmises telles quelles à la couche transport (hors moteur).
    constexpr uint16_t DEFAULT_LISTEN_PORT = 58080;
    constexpr int32_t  DEFAULT_PROXY_MARK  = 1;
    constexpr int32_t  DEFAULT_IGNORE_MARK = 255;
    constexpr uint8_t  DEFAULT_ROUTE_TABLE = 100;

    // --- RUNTIME ---
    // Threads du pool io_context (0 = std::thread::hardware_concurrency())
    constexpr uint32_t WORKER_THREADS = 0;

    // Borne haute acceptée pour -t
    constexpr uint32_t MAX_WORKER_THREADS = 256;
}

#endif // CTP_CONFIG_HPP
