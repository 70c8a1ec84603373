#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fivenav/config.hpp>
#include <fivenav/logger.hpp>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace fivenav
{

// ─── Region-keyed accessors ──────────────────────────────────────────────────

const std::string& PreviewConfig::label_for(Region r) const
{
    static const std::string empty;
    switch (r)
    {
        case Region::Left:
            return left_label;
        case Region::Right:
            return right_label;
        case Region::Top:
            return top_label;
        case Region::Bottom:
            return bottom_label;
        case Region::Center:
            break;
    }
    return empty;
}

bool SwipeBackConfig::enabled_for(Region r) const
{
    switch (r)
    {
        case Region::Left:
            return left;
        case Region::Right:
            return right;
        case Region::Top:
            return top;
        case Region::Bottom:
            return bottom;
        case Region::Center:
            break;
    }
    return false;
}

void SwipeBackConfig::set_enabled(Region r, bool enabled)
{
    switch (r)
    {
        case Region::Left:
            left = enabled;
            break;
        case Region::Right:
            right = enabled;
            break;
        case Region::Top:
            top = enabled;
            break;
        case Region::Bottom:
            bottom = enabled;
            break;
        case Region::Center:
            break;
    }
}

EasingFunc NavigatorConfig::easing() const
{
    if (custom_easing)
        return custom_easing;
    return easing_for(easing_kind);
}

// ─── Sanitize ────────────────────────────────────────────────────────────────

namespace
{

bool clamp_field(float& value, float lo, float hi, const char* name)
{
    float fixed = value;
    if (std::isnan(fixed))
        fixed = lo;
    fixed = std::min(std::max(fixed, lo), hi);
    if (fixed == value)
        return false;
    FIVENAV_LOG_WARN("config", "{} out of range ({}), clamped to {}", name, value, fixed);
    value = fixed;
    return true;
}

constexpr float MIN_DURATION = 0.01f;
constexpr float HUGE_VALUE   = 1.0e6f;

}   // anonymous namespace

bool NavigatorConfig::sanitize()
{
    bool changed = false;
    changed |= clamp_field(commit_threshold, 0.01f, 1.0f, "commit_threshold");
    changed |= clamp_field(detection.horizontal_band_width, 0.0f, HUGE_VALUE, "horizontal_band_width");
    changed |= clamp_field(detection.vertical_band_height, 0.0f, HUGE_VALUE, "vertical_band_height");
    changed |= clamp_field(transition_duration, MIN_DURATION, 60.0f, "transition_duration");
    changed |= clamp_field(return_duration, MIN_DURATION, 60.0f, "return_duration");
    changed |= clamp_field(zoom_out_scale, 0.01f, 10.0f, "zoom_out_scale");
    changed |= clamp_field(opacity_floor, 0.0f, 1.0f, "opacity_floor");
    changed |= clamp_field(swipe_back.edge_fraction, 0.0f, 1.0f, "swipe_back.edge_fraction");

    changed |= clamp_field(preview.appearance_threshold, 0.01f, 1.0f, "preview.appearance_threshold");
    changed |= clamp_field(preview.min_scale, 0.0f, 10.0f, "preview.min_scale");
    changed |= clamp_field(preview.max_scale, preview.min_scale, 10.0f, "preview.max_scale");
    changed |= clamp_field(preview.overscroll_scale_ceiling, 0.0f, 10.0f, "preview.overscroll_scale_ceiling");
    changed |= clamp_field(preview.shake_amplitude, 0.0f, HUGE_VALUE, "preview.shake_amplitude");
    changed |= clamp_field(preview.shake_frequency, 0.0f, 1000.0f, "preview.shake_frequency");
    changed |= clamp_field(preview.offset_from_edge, 0.0f, HUGE_VALUE, "preview.offset_from_edge");

    changed |= clamp_field(return_button.button_size, 0.0f, HUGE_VALUE, "return_button.button_size");
    changed |= clamp_field(return_button.icon_size, 0.0f, HUGE_VALUE, "return_button.icon_size");
    changed |= clamp_field(return_button.edge_offset, 0.0f, HUGE_VALUE, "return_button.edge_offset");

    changed |= clamp_field(center_entrance_duration, MIN_DURATION, 60.0f, "center_entrance_duration");
    return changed;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

namespace
{

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string color_to_hex(const Color& c)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "#%08X", c.to_argb());
    return buf;
}

std::optional<Color> color_from_hex(const std::string& s)
{
    if (s.size() != 9 || s[0] != '#')
        return std::nullopt;
    for (size_t i = 1; i < s.size(); ++i)
    {
        if (!std::isxdigit(static_cast<unsigned char>(s[i])))
            return std::nullopt;
    }
    auto argb = static_cast<uint32_t>(std::strtoul(s.c_str() + 1, nullptr, 16));
    return Color::from_argb(argb);
}

const char* bool_str(bool b)
{
    return b ? "true" : "false";
}

// Minimal JSON reader for our own format: flattens nested objects into
// dotted paths ("preview.min_scale") holding the raw scalar text.
// Arrays are accepted and skipped.
class FlatJsonReader
{
   public:
    struct Scalar
    {
        enum class Kind
        {
            String,
            Number,
            Bool,
            Null
        };
        Kind        kind = Kind::Null;
        std::string text;
    };

    using Map = std::unordered_map<std::string, Scalar>;

    explicit FlatJsonReader(const std::string& json) : src_(json) {}

    bool parse(Map& out)
    {
        skip_ws();
        if (!parse_object("", &out))
            return false;
        skip_ws();
        return pos_ == src_.size();
    }

   private:
    const std::string& src_;
    size_t             pos_ = 0;

    void skip_ws()
    {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_])))
            ++pos_;
    }

    bool consume(char c)
    {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool parse_string(std::string& out)
    {
        if (!consume('"'))
            return false;
        out.clear();
        while (pos_ < src_.size())
        {
            char c = src_[pos_++];
            if (c == '"')
                return true;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= src_.size())
                return false;
            char esc = src_[pos_++];
            switch (esc)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'u':
                {
                    if (pos_ + 4 > src_.size())
                        return false;
                    unsigned long cp = std::strtoul(src_.substr(pos_, 4).c_str(), nullptr, 16);
                    pos_ += 4;
                    // Labels are plain text; anything outside ASCII is replaced.
                    out += cp < 0x80 ? static_cast<char>(cp) : '?';
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    bool parse_value(const std::string& path, Map* out)
    {
        skip_ws();
        if (pos_ >= src_.size())
            return false;

        char c = src_[pos_];
        if (c == '{')
            return parse_object(path, out);
        if (c == '[')
            return parse_array(path);

        Scalar s;
        if (c == '"')
        {
            s.kind = Scalar::Kind::String;
            if (!parse_string(s.text))
                return false;
        }
        else if (src_.compare(pos_, 4, "true") == 0)
        {
            s.kind = Scalar::Kind::Bool;
            s.text = "true";
            pos_ += 4;
        }
        else if (src_.compare(pos_, 5, "false") == 0)
        {
            s.kind = Scalar::Kind::Bool;
            s.text = "false";
            pos_ += 5;
        }
        else if (src_.compare(pos_, 4, "null") == 0)
        {
            s.kind = Scalar::Kind::Null;
            pos_ += 4;
        }
        else
        {
            const char* begin = src_.c_str() + pos_;
            char*       end   = nullptr;
            std::strtod(begin, &end);
            if (end == begin)
                return false;
            s.kind = Scalar::Kind::Number;
            s.text.assign(begin, static_cast<size_t>(end - begin));
            pos_ += static_cast<size_t>(end - begin);
        }

        if (out)
            (*out)[path] = std::move(s);
        return true;
    }

    bool parse_object(const std::string& prefix, Map* out)
    {
        if (!consume('{'))
            return false;
        if (consume('}'))
            return true;

        while (true)
        {
            skip_ws();
            std::string key;
            if (!parse_string(key))
                return false;
            if (!consume(':'))
                return false;
            std::string path = prefix.empty() ? key : prefix + "." + key;
            if (!parse_value(path, out))
                return false;
            if (consume(','))
                continue;
            return consume('}');
        }
    }

    bool parse_array(const std::string& path)
    {
        if (!consume('['))
            return false;
        if (consume(']'))
            return true;
        while (true)
        {
            if (!parse_value(path, nullptr))
                return false;
            if (consume(','))
                continue;
            return consume(']');
        }
    }
};

using Scalar = FlatJsonReader::Scalar;

void read_float(const FlatJsonReader::Map& m, const char* key, float& dst)
{
    auto it = m.find(key);
    if (it != m.end() && it->second.kind == Scalar::Kind::Number)
        dst = std::strtof(it->second.text.c_str(), nullptr);
}

void read_bool(const FlatJsonReader::Map& m, const char* key, bool& dst)
{
    auto it = m.find(key);
    if (it != m.end() && it->second.kind == Scalar::Kind::Bool)
        dst = it->second.text == "true";
}

void read_string(const FlatJsonReader::Map& m, const char* key, std::string& dst)
{
    auto it = m.find(key);
    if (it != m.end() && it->second.kind == Scalar::Kind::String)
        dst = it->second.text;
}

void read_color(const FlatJsonReader::Map& m, const char* key, Color& dst)
{
    std::string hex;
    read_string(m, key, hex);
    if (hex.empty())
        return;
    if (auto c = color_from_hex(hex))
        dst = *c;
    else
        FIVENAV_LOG_WARN("config", "Ignoring malformed color '{}' for {}", hex, key);
}

}   // anonymous namespace

std::string NavigatorConfig::serialize() const
{
    std::ostringstream os;
    os << std::setprecision(6);
    os << "{\n";
    os << "  \"version\": 1,\n";
    os << "  \"commit_threshold\": " << commit_threshold << ",\n";
    os << "  \"detection\": {\n";
    os << "    \"horizontal_band_width\": " << detection.horizontal_band_width << ",\n";
    os << "    \"vertical_band_height\": " << detection.vertical_band_height << "\n";
    os << "  },\n";
    os << "  \"transition_duration\": " << transition_duration << ",\n";
    os << "  \"return_duration\": " << return_duration << ",\n";
    os << "  \"easing\": \"" << to_string(easing_kind) << "\",\n";
    os << "  \"zoom_out_scale\": " << zoom_out_scale << ",\n";
    os << "  \"opacity_floor\": " << opacity_floor << ",\n";
    os << "  \"swipe_back\": {\n";
    os << "    \"left\": " << bool_str(swipe_back.left) << ",\n";
    os << "    \"right\": " << bool_str(swipe_back.right) << ",\n";
    os << "    \"top\": " << bool_str(swipe_back.top) << ",\n";
    os << "    \"bottom\": " << bool_str(swipe_back.bottom) << ",\n";
    os << "    \"edge_fraction\": " << swipe_back.edge_fraction << "\n";
    os << "  },\n";
    os << "  \"preview\": {\n";
    os << "    \"enabled\": " << bool_str(preview.enabled) << ",\n";
    os << "    \"appearance_threshold\": " << preview.appearance_threshold << ",\n";
    os << "    \"min_scale\": " << preview.min_scale << ",\n";
    os << "    \"max_scale\": " << preview.max_scale << ",\n";
    os << "    \"overscroll_scale_ceiling\": " << preview.overscroll_scale_ceiling << ",\n";
    os << "    \"shake_amplitude\": " << preview.shake_amplitude << ",\n";
    os << "    \"shake_frequency\": " << preview.shake_frequency << ",\n";
    os << "    \"offset_from_edge\": " << preview.offset_from_edge << ",\n";
    os << "    \"left_label\": \"" << escape_json(preview.left_label) << "\",\n";
    os << "    \"right_label\": \"" << escape_json(preview.right_label) << "\",\n";
    os << "    \"top_label\": \"" << escape_json(preview.top_label) << "\",\n";
    os << "    \"bottom_label\": \"" << escape_json(preview.bottom_label) << "\",\n";
    os << "    \"chip_background\": \"" << color_to_hex(preview.chip_background) << "\",\n";
    os << "    \"chip_text\": \"" << color_to_hex(preview.chip_text) << "\",\n";
    os << "    \"chip_padding_x\": " << preview.chip_padding_x << ",\n";
    os << "    \"chip_padding_y\": " << preview.chip_padding_y << ",\n";
    os << "    \"chip_corner_radius\": " << preview.chip_corner_radius << "\n";
    os << "  },\n";
    os << "  \"return_button\": {\n";
    os << "    \"visible\": " << bool_str(return_button.visible) << ",\n";
    os << "    \"background\": \"" << color_to_hex(return_button.background) << "\",\n";
    os << "    \"icon\": \"" << color_to_hex(return_button.icon) << "\",\n";
    os << "    \"button_size\": " << return_button.button_size << ",\n";
    os << "    \"icon_size\": " << return_button.icon_size << ",\n";
    os << "    \"edge_offset\": " << return_button.edge_offset << "\n";
    os << "  },\n";
    os << "  \"haptic\": \"" << to_string(haptic) << "\",\n";
    os << "  \"animate_center_entrance\": " << bool_str(animate_center_entrance) << ",\n";
    os << "  \"center_entrance_duration\": " << center_entrance_duration << ",\n";
    os << "  \"log_level\": \"" << Logger::level_to_string(log_level) << "\"\n";
    os << "}\n";
    return os.str();
}

bool NavigatorConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    FlatJsonReader::Map values;
    FlatJsonReader      reader(json);
    if (!reader.parse(values))
    {
        FIVENAV_LOG_WARN("config", "Malformed navigator config JSON");
        return false;
    }

    auto version = values.find("version");
    if (version != values.end() && version->second.kind == Scalar::Kind::Number)
    {
        int v = std::atoi(version->second.text.c_str());
        if (v > 1)
            FIVENAV_LOG_WARN("config", "Config version {} is newer than supported (1)", v);
    }

    NavigatorConfig next = *this;

    read_float(values, "commit_threshold", next.commit_threshold);
    read_float(values, "detection.horizontal_band_width", next.detection.horizontal_band_width);
    read_float(values, "detection.vertical_band_height", next.detection.vertical_band_height);
    read_float(values, "transition_duration", next.transition_duration);
    read_float(values, "return_duration", next.return_duration);
    read_float(values, "zoom_out_scale", next.zoom_out_scale);
    read_float(values, "opacity_floor", next.opacity_floor);

    std::string easing_name;
    read_string(values, "easing", easing_name);
    if (!easing_name.empty())
    {
        if (auto kind = easing_from_string(easing_name))
            next.easing_kind = *kind;
        else
            FIVENAV_LOG_WARN("config", "Unknown easing '{}', keeping {}", easing_name, to_string(next.easing_kind));
    }

    read_bool(values, "swipe_back.left", next.swipe_back.left);
    read_bool(values, "swipe_back.right", next.swipe_back.right);
    read_bool(values, "swipe_back.top", next.swipe_back.top);
    read_bool(values, "swipe_back.bottom", next.swipe_back.bottom);
    read_float(values, "swipe_back.edge_fraction", next.swipe_back.edge_fraction);

    read_bool(values, "preview.enabled", next.preview.enabled);
    read_float(values, "preview.appearance_threshold", next.preview.appearance_threshold);
    read_float(values, "preview.min_scale", next.preview.min_scale);
    read_float(values, "preview.max_scale", next.preview.max_scale);
    read_float(values, "preview.overscroll_scale_ceiling", next.preview.overscroll_scale_ceiling);
    read_float(values, "preview.shake_amplitude", next.preview.shake_amplitude);
    read_float(values, "preview.shake_frequency", next.preview.shake_frequency);
    read_float(values, "preview.offset_from_edge", next.preview.offset_from_edge);
    read_string(values, "preview.left_label", next.preview.left_label);
    read_string(values, "preview.right_label", next.preview.right_label);
    read_string(values, "preview.top_label", next.preview.top_label);
    read_string(values, "preview.bottom_label", next.preview.bottom_label);
    read_color(values, "preview.chip_background", next.preview.chip_background);
    read_color(values, "preview.chip_text", next.preview.chip_text);
    read_float(values, "preview.chip_padding_x", next.preview.chip_padding_x);
    read_float(values, "preview.chip_padding_y", next.preview.chip_padding_y);
    read_float(values, "preview.chip_corner_radius", next.preview.chip_corner_radius);

    read_bool(values, "return_button.visible", next.return_button.visible);
    read_color(values, "return_button.background", next.return_button.background);
    read_color(values, "return_button.icon", next.return_button.icon);
    read_float(values, "return_button.button_size", next.return_button.button_size);
    read_float(values, "return_button.icon_size", next.return_button.icon_size);
    read_float(values, "return_button.edge_offset", next.return_button.edge_offset);

    std::string haptic_name;
    read_string(values, "haptic", haptic_name);
    if (!haptic_name.empty())
    {
        if (auto h = haptic_from_string(haptic_name))
            next.haptic = *h;
        else
            FIVENAV_LOG_WARN("config", "Unknown haptic intensity '{}'", haptic_name);
    }

    read_bool(values, "animate_center_entrance", next.animate_center_entrance);
    read_float(values, "center_entrance_duration", next.center_entrance_duration);

    std::string level_name;
    read_string(values, "log_level", level_name);
    if (!level_name.empty())
    {
        if (auto lvl = Logger::level_from_string(level_name))
            next.log_level = *lvl;
        else
            FIVENAV_LOG_WARN("config", "Unknown log level '{}'", level_name);
    }

    next.sanitize();
    *this = std::move(next);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool NavigatorConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    if (ec)
        FIVENAV_LOG_WARN("config", "Could not create {}: {}", parent.string(), ec.message());

    std::ofstream f(path);
    if (!f.is_open())
    {
        FIVENAV_LOG_WARN("config", "Could not open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool NavigatorConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        FIVENAV_LOG_DEBUG("config", "No config at {}", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string NavigatorConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "navigator.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "fivenav";
    return (dir / "navigator.json").string();
}

}   // namespace fivenav
