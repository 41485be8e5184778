// EDN form reader used for type descriptors and value literals
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cmath>
#include <limits>

namespace deepeq
{

    struct form_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct form;

    using form_ptr = std::shared_ptr<form>;

    struct list
    {
        std::vector<form_ptr> elems;
    };
    struct vector_t
    {
        std::vector<form_ptr> elems;
    };
    struct set
    {
        std::vector<form_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<form_ptr, form_ptr>> entries;
    };
    struct tagged
    {
        symbol tag;
        form_ptr inner;
    };

    using form_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, set, map, tagged>;

    struct form
    {
        form_data data;
        int line = -1;
        int col = -1;
    };

    // Read exactly one EDN form; trailing content is an error.
    inline form_ptr parse(std::string_view src);

    inline std::string to_string(const form &f);
    inline std::string to_string(const form_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }

    inline std::string where(const form &f) { return std::to_string(f.line) + ":" + std::to_string(f.col); }

    namespace detail
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char get()
            {
                if (eof())
                    return '\0';
                char c = d[p++];
                if (c == '\n')
                {
                    ++line;
                    col = 1;
                }
                else
                {
                    ++col;
                }
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';')
                    {
                        while (!eof() && get() != '\n')
                            continue;
                        continue;
                    }
                    if (c == ' ' || c == ',' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string &msg) const
            {
                throw form_error(std::to_string(line) + ":" + std::to_string(col) + ": " + msg);
            }
        };
        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&' || c == '.'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '#' || c == ':'; }

        inline form_ptr make_form(form_data d, int line, int col) { return std::make_shared<form>(form{std::move(d), line, col}); }

        inline form_ptr parse_value(reader &);

        inline form_ptr parse_collection(reader &r, char end, int sl, int sc, bool as_set = false)
        {
            std::vector<form_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                r.fail(std::string("unterminated collection, expected '") + end + "'");
            if (as_set)
                return make_form(set{std::move(elems)}, sl, sc);
            if (end == ')')
                return make_form(list{std::move(elems)}, sl, sc);
            if (end == ']')
                return make_form(vector_t{std::move(elems)}, sl, sc);
            if (elems.size() % 2)
                throw form_error(std::to_string(sl) + ":" + std::to_string(sc) + ": map requires even number of forms");
            map m;
            for (size_t i = 0; i < elems.size(); i += 2)
                m.entries.emplace_back(elems[i], elems[i + 1]);
            return make_form(std::move(m), sl, sc);
        }

        inline form_ptr parse_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get(); // opening quote
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"')
                {
                    closed = true;
                    break;
                }
                if (c == '\\')
                {
                    if (r.eof())
                        r.fail("bad escape");
                    char e = r.get();
                    switch (e)
                    {
                    case 'n':
                        out += '\n';
                        break;
                    case 'r':
                        out += '\r';
                        break;
                    case 't':
                        out += '\t';
                        break;
                    case '"':
                        out += '"';
                        break;
                    case '\\':
                        out += '\\';
                        break;
                    default:
                        out += e;
                        break;
                    }
                }
                else
                    out += c;
            }
            if (!closed)
                r.fail("unterminated string");
            return make_form(std::move(out), sl, sc);
        }

        inline form_ptr parse_number(reader &r)
        {
            int sl = r.line, sc = r.col;
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            bool is_float = false;
            while (is_digit(r.peek()))
                num += r.get();
            if (r.peek() == '.')
            {
                is_float = true;
                num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            if (r.peek() == 'e' || r.peek() == 'E')
            {
                is_float = true;
                num += r.get();
                if (r.peek() == '+' || r.peek() == '-')
                    num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            try
            {
                if (is_float)
                    return make_form(std::stod(num), sl, sc);
                return make_form(static_cast<int64_t>(std::stoll(num)), sl, sc);
            }
            catch (const std::logic_error &)
            {
                throw form_error(std::to_string(sl) + ":" + std::to_string(sc) + ": invalid number '" + num + "'");
            }
        }

        inline form_ptr parse_symbol_or_keyword(reader &r)
        {
            int sl = r.line, sc = r.col;
            bool kw = false;
            if (r.peek() == ':')
            {
                kw = true;
                r.get();
            }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            if (s.empty())
                r.fail("empty symbol");
            if (kw)
                return make_form(keyword{s}, sl, sc);
            if (s == "nil")
                return make_form(std::monostate{}, sl, sc);
            if (s == "true")
                return make_form(true, sl, sc);
            if (s == "false")
                return make_form(false, sl, sc);
            return make_form(symbol{s}, sl, sc);
        }

        // After '#': set literal, symbolic float (##NaN) or tagged form.
        inline form_ptr parse_dispatch(reader &r, int sl, int sc)
        {
            if (r.peek() == '{')
            {
                r.get();
                return parse_collection(r, '}', sl, sc, true);
            }
            if (r.peek() == '#')
            {
                r.get();
                std::string name;
                while (is_symbol_char(r.peek()))
                    name += r.get();
                if (name == "NaN")
                    return make_form(std::numeric_limits<double>::quiet_NaN(), sl, sc);
                if (name == "Inf")
                    return make_form(std::numeric_limits<double>::infinity(), sl, sc);
                if (name == "-Inf")
                    return make_form(-std::numeric_limits<double>::infinity(), sl, sc);
                r.fail("unknown symbolic value ##" + name);
            }
            std::string tag;
            while (is_symbol_char(r.peek()))
                tag += r.get();
            if (tag.empty())
                r.fail("tag expected after '#'");
            r.skip_ws();
            if (r.eof())
                r.fail("tagged form #" + tag + " has no value");
            auto inner = parse_value(r);
            return make_form(tagged{symbol{tag}, inner}, sl, sc);
        }

        inline form_ptr parse_value(reader &r)
        {
            r.skip_ws();
            if (r.eof())
                r.fail("unexpected end of input");
            int sl = r.line, sc = r.col;
            char c = r.peek();
            switch (c)
            {
            case '(':
                r.get();
                return parse_collection(r, ')', sl, sc);
            case '[':
                r.get();
                return parse_collection(r, ']', sl, sc);
            case '{':
                r.get();
                return parse_collection(r, '}', sl, sc);
            case '"':
                return parse_string(r);
            case '#':
                r.get();
                return parse_dispatch(r, sl, sc);
            default:
                break;
            }
            if (is_digit(c))
                return parse_number(r);
            if ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1]))
                return parse_number(r);
            if (c == ':' || is_symbol_start(c))
                return parse_symbol_or_keyword(r);
            r.fail(std::string("unexpected character '") + c + "'");
        }

        inline std::string render_double(double d)
        {
            if (std::isnan(d))
                return "##NaN";
            if (std::isinf(d))
                return d > 0 ? "##Inf" : "##-Inf";
            std::ostringstream oss;
            oss << d;
            std::string s = oss.str();
            if (s.find_first_of(".eE") == std::string::npos)
                s += ".0";
            return s;
        }

        template <typename Seq>
        std::string join_forms(const Seq &elems, const char *open, char close)
        {
            std::string out = open;
            bool first = true;
            for (auto &ch : elems)
            {
                if (!first)
                    out += ' ';
                first = false;
                out += to_string(ch);
            }
            out += close;
            return out;
        }
    }

    inline form_ptr parse(std::string_view src)
    {
        detail::reader r(src);
        auto v = detail::parse_value(r);
        r.skip_ws();
        if (!r.eof())
            r.fail("trailing content after single form");
        return v;
    }

    inline std::string to_string(const form &f)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const { return detail::render_double(d); }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string operator()(const list &l) const { return detail::join_forms(l.elems, "(", ')'); }
            std::string operator()(const vector_t &v) const { return detail::join_forms(v.elems, "[", ']'); }
            std::string operator()(const set &s) const { return detail::join_forms(s.elems, "#{", '}'); }
            std::string operator()(const map &m) const
            {
                std::string out = "{";
                bool first = true;
                for (auto &kv : m.entries)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(kv.first) + ' ' + to_string(kv.second);
                }
                out += '}';
                return out;
            }
            std::string operator()(const tagged &tv) const { return '#' + tv.tag.name + ' ' + to_string(tv.inner); }
        };
        return std::visit(V{}, f.data);
    }

    inline bool is_symbol(const form &f) { return std::holds_alternative<symbol>(f.data); }
    inline bool is_keyword(const form &f) { return std::holds_alternative<keyword>(f.data); }
    inline bool is_list(const form &f) { return std::holds_alternative<list>(f.data); }
    inline bool is_nil(const form &f) { return std::holds_alternative<std::monostate>(f.data); }
    inline const list *as_list(const form &f) { return is_list(f) ? &std::get<list>(f.data) : nullptr; }
    inline const symbol *as_symbol(const form &f) { return is_symbol(f) ? &std::get<symbol>(f.data) : nullptr; }

    // Head symbol name of a list form, or empty.
    inline std::string head_name(const form &f)
    {
        auto l = as_list(f);
        if (!l || l->elems.empty() || !l->elems[0] || !is_symbol(*l->elems[0]))
            return {};
        return std::get<symbol>(l->elems[0]->data).name;
    }

    // Name given either as symbol or string (:name Foo / :name "Foo").
    inline bool name_of(const form &f, std::string &out)
    {
        if (auto s = as_symbol(f))
        {
            out = s->name;
            return true;
        }
        if (std::holds_alternative<std::string>(f.data))
        {
            out = std::get<std::string>(f.data);
            return true;
        }
        return false;
    }

} // namespace deepeq
