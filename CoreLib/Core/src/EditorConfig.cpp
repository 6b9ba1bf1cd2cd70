#include "EditorConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "CoreUtilities.hpp"

namespace
{
    constexpr const char* kHeader  = "matcap_config";
    constexpr int32_t     kVersion = 1;

    std::string trim(std::string s)
    {
        size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a])))
            ++a;

        size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
            --b;

        return s.substr(a, b - a);
    }

    bool is_comment_or_empty(const std::string& s)
    {
        return s.empty() || s.rfind("#", 0) == 0 || s.rfind("//", 0) == 0;
    }

    // Splits by whitespace, supports quoted strings: export.path "my matcap.png"
    // Inside quotes a backslash takes the next character literally.
    std::vector<std::string> tokenize(const std::string& line)
    {
        std::vector<std::string> out;
        std::string              cur;
        bool                     inQuote = false;
        bool                     escaped = false;

        for (char c : line)
        {
            if (inQuote)
            {
                if (escaped)
                {
                    cur.push_back(c);
                    escaped = false;
                }
                else if (c == '\\')
                {
                    escaped = true;
                }
                else if (c == '"')
                {
                    inQuote = false;
                    out.push_back(cur);
                    cur.clear();
                }
                else
                {
                    cur.push_back(c);
                }
                continue;
            }

            if (c == '"')
            {
                inQuote = true;
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(c)))
            {
                if (!cur.empty())
                {
                    out.push_back(cur);
                    cur.clear();
                }
                continue;
            }

            cur.push_back(c);
        }

        if (!cur.empty())
            out.push_back(cur);

        return out;
    }

    std::string quote(const std::string& s)
    {
        std::string out = "\"";
        for (char c : s)
        {
            if (c == '"' || c == '\\')
                out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    bool parse_int32(const std::string& s, int32_t& v)
    {
        try
        {
            size_t    idx = 0;
            long long t   = std::stoll(s, &idx, 10);
            if (idx != s.size())
                return false;
            if (t < std::numeric_limits<int32_t>::min() || t > std::numeric_limits<int32_t>::max())
                return false;
            v = static_cast<int32_t>(t);
            return true;
        }
        catch (const std::logic_error&)
        {
            // invalid_argument / out_of_range
            return false;
        }
    }

    bool parse_float(const std::string& s, float& v)
    {
        try
        {
            size_t idx = 0;
            float  t   = std::stof(s, &idx);
            if (idx != s.size())
                return false;
            v = t;
            return true;
        }
        catch (const std::logic_error&)
        {
            return false;
        }
    }

    bool parse_bool(const std::string& s, bool& v)
    {
        if (s == "1" || s == "true" || s == "on")
        {
            v = true;
            return true;
        }
        if (s == "0" || s == "false" || s == "off")
        {
            v = false;
            return true;
        }
        return false;
    }

    bool parse_side(const std::string& s, PlacementSide& v)
    {
        if (s == "front")
        {
            v = PlacementSide::Front;
            return true;
        }
        if (s == "back")
        {
            v = PlacementSide::Back;
            return true;
        }
        return false;
    }

    using Args   = std::vector<std::string>; // tokens after the key
    using Setter = std::function<bool(const Args&, EditorConfig&)>;

    template<typename Fn>
    Setter one_float(Fn field)
    {
        return [field](const Args& a, EditorConfig& c) {
            return a.size() == 1 && parse_float(a[0], field(c));
        };
    }

    const std::unordered_map<std::string, Setter>& setters()
    {
        static const std::unordered_map<std::string, Setter> table = {
            {"ambient.color", [](const Args& a, EditorConfig& c) {
                 return a.size() == 3 &&
                        parse_float(a[0], c.ambient.color.x) &&
                        parse_float(a[1], c.ambient.color.y) &&
                        parse_float(a[2], c.ambient.color.z);
             }},
            {"ambient.intensity", one_float([](EditorConfig& c) -> float& { return c.ambient.intensity; })},
            {"material.roughness", one_float([](EditorConfig& c) -> float& { return c.material.roughness; })},
            {"material.metalness", one_float([](EditorConfig& c) -> float& { return c.material.metalness; })},
            {"create.distance", one_float([](EditorConfig& c) -> float& { return c.create.distance; })},
            {"create.lightType", [](const Args& a, EditorConfig& c) {
                 return a.size() == 1 && lightTypeFromName(a[0], c.create.lightType);
             }},
            {"create.side", [](const Args& a, EditorConfig& c) {
                 return a.size() == 1 && parse_side(a[0], c.create.side);
             }},
            {"sizes.displayRatio", one_float([](EditorConfig& c) -> float& { return c.displayRatio; })},
            {"sizes.exportSize", [](const Args& a, EditorConfig& c) {
                 return a.size() == 1 && parse_int32(a[0], c.sizes.exportSize);
             }},
            {"sizes.exportRatio", one_float([](EditorConfig& c) -> float& { return c.sizes.exportRatio; })},
            {"view.fov", one_float([](EditorConfig& c) -> float& { return c.view.fovDeg; })},
            {"view.distance", one_float([](EditorConfig& c) -> float& { return c.view.distance; })},
            {"capture.halfSize", one_float([](EditorConfig& c) -> float& { return c.capture.halfSize; })},
            {"capture.near", one_float([](EditorConfig& c) -> float& { return c.capture.nearClip; })},
            {"capture.far", one_float([](EditorConfig& c) -> float& { return c.capture.farClip; })},
            {"capture.distance", one_float([](EditorConfig& c) -> float& { return c.capture.distance; })},
            {"snapshot.timeoutMs", [](const Args& a, EditorConfig& c) {
                 return a.size() == 1 && parse_int32(a[0], c.snapshot.encodeTimeoutMs);
             }},
            {"export.path", [](const Args& a, EditorConfig& c) {
                 if (a.size() != 1)
                     return false;
                 c.exportPath = a[0];
                 return true;
             }},
            {"ui.lightsVisible", [](const Args& a, EditorConfig& c) {
                 return a.size() == 1 && parse_bool(a[0], c.isUILightVisible);
             }},
        };
        return table;
    }

} // namespace

namespace config
{
    void sanitize(EditorConfig& cfg) noexcept
    {
        const EditorConfig def{};

        for (int i = 0; i < 3; ++i)
            cfg.ambient.color[i] = un::sanitize(cfg.ambient.color[i], def.ambient.color[i], 0.0f, 1.0f);
        cfg.ambient.intensity = un::sanitize(cfg.ambient.intensity, def.ambient.intensity, 0.0f, 100.0f);

        cfg.material.roughness = un::sanitize(cfg.material.roughness, def.material.roughness, 0.0f, 1.0f);
        cfg.material.metalness = un::sanitize(cfg.material.metalness, def.material.metalness, 0.0f, 1.0f);

        cfg.create.distance = un::sanitize(cfg.create.distance, def.create.distance, 0.0f, 100.0f);

        cfg.displayRatio      = un::sanitize(cfg.displayRatio, def.displayRatio, 0.25f, 8.0f);
        cfg.sizes.exportSize  = std::clamp<int32_t>(cfg.sizes.exportSize, 16, kMaxTargetEdge);
        cfg.sizes.exportRatio = un::sanitize(cfg.sizes.exportRatio, def.sizes.exportRatio, 1.0f, 16.0f);
        cfg.sizes.exportRatio = std::min(cfg.sizes.exportRatio,
                                         std::max(1.0f, float(kMaxTargetEdge) / float(cfg.sizes.exportSize)));

        cfg.view.fovDeg   = un::sanitize(cfg.view.fovDeg, def.view.fovDeg, 1.0f, 179.0f);
        cfg.view.distance = un::sanitize(cfg.view.distance, def.view.distance, 0.05f, 1000.0f);

        cfg.capture.halfSize = un::sanitize(cfg.capture.halfSize, def.capture.halfSize, 1e-3f, 1000.0f);
        cfg.capture.nearClip = un::sanitize(cfg.capture.nearClip, def.capture.nearClip, 0.0f, 1000.0f);
        cfg.capture.farClip  = un::sanitize(cfg.capture.farClip, def.capture.farClip, cfg.capture.nearClip + 1e-3f, 1e6f);
        cfg.capture.distance = un::sanitize(cfg.capture.distance, def.capture.distance, 1e-3f, 1000.0f);

        cfg.snapshot.encodeTimeoutMs = std::clamp<int32_t>(cfg.snapshot.encodeTimeoutMs, 1, 600000);

        if (cfg.exportPath.empty())
            cfg.exportPath = def.exportPath;
    }

    bool loadEditorConfig(const std::filesystem::path& path, EditorConfig& cfg)
    {
        std::ifstream in(path);
        if (!in)
        {
            std::cerr << "EditorConfig: cannot open " << path.string() << "\n";
            return false;
        }

        EditorConfig loaded = cfg;
        bool         header = false;

        std::string line;
        int32_t     lineNo = 0;
        while (std::getline(in, line))
        {
            ++lineNo;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            const std::string s = trim(line);
            if (is_comment_or_empty(s))
                continue;

            auto tok = tokenize(s);
            if (tok.empty())
                continue;

            if (!header)
            {
                int32_t version = 0;
                if (tok.size() != 2 || tok[0] != kHeader || !parse_int32(tok[1], version) || version > kVersion)
                {
                    std::cerr << "EditorConfig: " << path.string() << " is not a matcap_config v" << kVersion << " file\n";
                    return false;
                }
                header = true;
                continue;
            }

            const auto& table = setters();
            auto        it    = table.find(tok[0]);
            if (it == table.end())
            {
                std::cerr << "EditorConfig: " << path.string() << ":" << lineNo << ": unknown key '" << tok[0] << "' ignored\n";
                continue;
            }

            const Args args(tok.begin() + 1, tok.end());
            if (!it->second(args, loaded))
            {
                std::cerr << "EditorConfig: " << path.string() << ":" << lineNo << ": invalid value for '" << tok[0] << "'\n";
                return false;
            }
        }

        if (!header)
        {
            std::cerr << "EditorConfig: " << path.string() << " is empty\n";
            return false;
        }

        sanitize(loaded);
        cfg = std::move(loaded);
        return true;
    }

    bool saveEditorConfig(const std::filesystem::path& path, const EditorConfig& cfg)
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out)
        {
            std::cerr << "EditorConfig: cannot write " << path.string() << "\n";
            return false;
        }

        out.precision(std::numeric_limits<float>::max_digits10);

        out << kHeader << " " << kVersion << "\n\n";

        out << "# lighting\n";
        out << "ambient.color " << cfg.ambient.color.x << " " << cfg.ambient.color.y << " " << cfg.ambient.color.z << "\n";
        out << "ambient.intensity " << cfg.ambient.intensity << "\n";
        out << "material.roughness " << cfg.material.roughness << "\n";
        out << "material.metalness " << cfg.material.metalness << "\n\n";

        out << "# placement\n";
        out << "create.distance " << cfg.create.distance << "\n";
        out << "create.lightType " << lightTypeName(cfg.create.lightType) << "\n";
        out << "create.side " << (cfg.create.side == PlacementSide::Front ? "front" : "back") << "\n\n";

        out << "# sizes\n";
        out << "sizes.displayRatio " << cfg.displayRatio << "\n";
        out << "sizes.exportSize " << cfg.sizes.exportSize << "\n";
        out << "sizes.exportRatio " << cfg.sizes.exportRatio << "\n\n";

        out << "# cameras\n";
        out << "view.fov " << cfg.view.fovDeg << "\n";
        out << "view.distance " << cfg.view.distance << "\n";
        out << "capture.halfSize " << cfg.capture.halfSize << "\n";
        out << "capture.near " << cfg.capture.nearClip << "\n";
        out << "capture.far " << cfg.capture.farClip << "\n";
        out << "capture.distance " << cfg.capture.distance << "\n\n";

        out << "# output\n";
        out << "snapshot.timeoutMs " << cfg.snapshot.encodeTimeoutMs << "\n";
        out << "export.path " << quote(cfg.exportPath.generic_string()) << "\n";
        out << "ui.lightsVisible " << (cfg.isUILightVisible ? 1 : 0) << "\n";

        out.flush();
        if (!out)
        {
            std::cerr << "EditorConfig: write failed for " << path.string() << "\n";
            return false;
        }
        return true;
    }

} // namespace config
