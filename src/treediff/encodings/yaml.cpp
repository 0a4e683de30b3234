#include <treediff/encodings/yaml.hpp>

#include <cctype>
#include <sstream>

#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <treediff/core/type_interfaces.hpp>
#include <treediff/core/utilities.hpp>

namespace treediff {

static bool
safe_isdigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch));
}

static dynamic
read_yaml_value(YAML::Node const& yaml);

static dynamic_array
read_yaml_sequence(YAML::Node const& yaml)
{
    dynamic_array array;
    array.reserve(yaml.size());
    for (auto const& i : yaml)
    {
        array.push_back(read_yaml_value(i));
    }
    return array;
}

// Read a YAML value into a dynamic.
static dynamic
read_yaml_value(YAML::Node const& yaml)
{
    switch (yaml.Type())
    {
        case YAML::NodeType::Null:
        default: // to avoid warnings
            return nil;
        case YAML::NodeType::Scalar: {
            // This case captures strings, booleans, integers, and doubles.
            // First, check to see if the value was explicitly quoted.
            if (yaml.Tag() == "!")
            {
                // Times are also encoded as quoted strings, so this checks to
                // see if the string parses as a time. If so, it just assumes
                // it's actually a time.
                auto s = yaml.as<string>();
                // First check if it looks anything like a time string.
                if (s.length() > 16 && safe_isdigit(s[0]) && safe_isdigit(s[1])
                    && safe_isdigit(s[2]) && safe_isdigit(s[3]) && s[4] == '-')
                {
                    try
                    {
                        auto t = parse_ptime(s);
                        // Check that it can be converted back without changing
                        // its value. This could be necessary if we actually
                        // expected a string here.
                        if (to_value_string(t) == s)
                        {
                            return t;
                        }
                    }
                    catch (parsing_error&)
                    {
                    }
                }
                return s;
            }
            else // The value wasn't quoted.
            {
                auto s = yaml.as<string>();
                // Try to interpret it as a boolean.
                if (s == "true")
                    return true;
                if (s == "false")
                    return false;
                // Try to interpret it as a number.
                if (!s.compare(0, 2, "0x"))
                {
                    std::istringstream stream(s.substr(2));
                    integer i;
                    stream >> std::hex >> i;
                    if (!stream.fail() && stream.tellg() == std::streampos(-1))
                    {
                        return i;
                    }
                }
                if (!s.compare(0, 2, "0o"))
                {
                    std::istringstream stream(s.substr(2));
                    integer i;
                    stream >> std::oct >> i;
                    if (!stream.fail() && stream.tellg() == std::streampos(-1))
                    {
                        return i;
                    }
                }
                {
                    integer i;
                    if (boost::conversion::try_lexical_convert(s, i))
                    {
                        return i;
                    }
                }
                {
                    double d;
                    if (boost::conversion::try_lexical_convert(s, d))
                    {
                        return d;
                    }
                }
                // If all else fails, it must just be a string.
                return s;
            }
        }
        case YAML::NodeType::Sequence: {
            auto array = read_yaml_sequence(yaml);
            if (yaml.Tag() == "!set")
                return dynamic_set(array.begin(), array.end());
            if (yaml.Tag() == "!list")
                return dynamic_list(array.begin(), array.end());
            return array;
        }
        case YAML::NodeType::Map: {
            dynamic_map map;
            for (YAML::Node::const_iterator i = yaml.begin(); i != yaml.end();
                 ++i)
            {
                map[read_yaml_value(i->first)] = read_yaml_value(i->second);
            }
            return map;
        }
    }
}

dynamic
parse_yaml_value(char const* yaml, size_t length)
{
    YAML::Node parsed_yaml;
    try
    {
        parsed_yaml = YAML::Load(string(yaml, yaml + length));
    }
    catch (YAML::Exception& e)
    {
        TREEDIFF_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(string(yaml, yaml + length))
                            << parsing_error_info(e.what()));
    }
    return read_yaml_value(parsed_yaml);
}

// Containers with at least this many items are summarized in diagnostic
// output.
static size_t const diagnostic_size_limit = 64;

static void
emit_yaml_value(YAML::Emitter& out, dynamic const& v, bool diagnostic);

template<class Container>
static void
emit_yaml_sequence(
    YAML::Emitter& out,
    Container const& items,
    char const* tag,
    bool diagnostic)
{
    if (diagnostic && items.size() >= diagnostic_size_limit)
    {
        out << "<" + string(tag ? tag : "array")
                   + " - size: " + lexical_cast<string>(items.size()) + ">";
        return;
    }
    if (tag)
        out << YAML::LocalTag(tag);
    out << YAML::BeginSeq;
    for (auto const& i : items)
    {
        emit_yaml_value(out, i, diagnostic);
    }
    out << YAML::EndSeq;
}

static void
emit_yaml_value(YAML::Emitter& out, dynamic const& v, bool diagnostic)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Null;
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::FLOAT: {
            // Floats with integral values are written with a trailing ".0" so
            // that they're read back as floats rather than integers.
            auto text = fmt::format("{}", cast<double>(v));
            if (text.find_first_not_of("-0123456789") == string::npos)
                text += ".0";
            out << text;
            break;
        }
        case value_type::STRING: {
            auto const& text = cast<string>(v);
            if (text.empty() || text == "~" || text == "null"
                || read_yaml_value(YAML::Node(text)).type()
                       != value_type::STRING)
            {
                // This happens to be a string that looks like some other
                // scalar type, so it should be explicitly quoted.
                out << YAML::DoubleQuoted << text;
            }
            else
            {
                out << text;
            }
            break;
        }
        case value_type::DATETIME:
            out << YAML::DoubleQuoted << to_value_string(cast<ptime>(v));
            break;
        case value_type::ARRAY:
            emit_yaml_sequence(out, cast<dynamic_array>(v), nullptr, diagnostic);
            break;
        case value_type::LIST:
            emit_yaml_sequence(out, cast<dynamic_list>(v), "list", diagnostic);
            break;
        case value_type::SET:
            emit_yaml_sequence(out, cast<dynamic_set>(v), "set", diagnostic);
            break;
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (diagnostic && x.size() >= diagnostic_size_limit)
            {
                out << "<map - size: " + lexical_cast<string>(x.size()) + ">";
                break;
            }
            out << YAML::BeginMap;
            for (auto const& i : x)
            {
                emit_yaml_value(out << YAML::Key, i.first, diagnostic);
                emit_yaml_value(out << YAML::Value, i.second, diagnostic);
            }
            out << YAML::EndMap;
            break;
        }
    }
}

string
value_to_yaml(dynamic const& v)
{
    YAML::Emitter out;
    emit_yaml_value(out, v, false);
    return out.c_str();
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    YAML::Emitter out;
    emit_yaml_value(out, v, true);
    return out.c_str();
}

} // namespace treediff
