#ifndef CTP_IO_LOADER_HPP
#define CTP_IO_LOADER_HPP

#include <string>
#include <string_view>
#include "../core/types.hpp"
#include "translator.hpp"

namespace ctp::io {

    class Loader {
    public:
        /**
         * Charge et valide la configuration complète.
         * Format choisi par l'extension :
         *   .msgpack        -> MessagePack (DTOs MSGPACK_DEFINE_MAP)
         *   .yaml .yml .json -> yaml-cpp (le JSON est du YAML en syntaxe flow)
         * Retourne false (cause loggée) si le fichier est illisible ou invalide ;
         * out n'est alors pas modifié.
         */
        static bool load(const std::string& path, Config& out);

        // Désérialisation seule, sans validation. Lèvent en cas d'échec.
        static core::RawConfig parse_msgpack(std::string_view data);
        static core::RawConfig parse_yaml(const std::string& text);

    private:
        static bool read_file(const std::string& path, std::string& out);
    };
}

#endif // CTP_IO_LOADER_HPP
