// S-expression tree consumed by semantic analysis and code generation.
// Every node carries a metadata map: the reader stores source positions there,
// the checker stores resolved types and destruction obligations.
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <cctype>
#include <map>
#include <cstdint>
#include <cstdlib>

namespace tagc
{

    struct parse_error : std::runtime_error
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
    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    namespace detail
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            int last_line = 1, last_col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char get()
            {
                if (eof())
                    return '\0';
                last_line = line;
                last_col = col;
                char c = d[p++];
                if (c == '\n') { ++line; col = 1; }
                else ++col;
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';') { while (!eof() && get() != '\n') continue; continue; }
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',') { get(); continue; }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string &msg) const
            {
                throw parse_error(msg + " at " + std::to_string(line) + ":" + std::to_string(col));
            }
        };
        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == ':'; }

        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline node_ptr make_int(int64_t v) { return make_node(node_data{v}); }
        inline void attach_pos(node &n, int sl, int sc)
        {
            n.metadata["line"] = make_int(sl);
            n.metadata["col"] = make_int(sc);
        }

        inline node_ptr parse_value(reader &);

        inline node_ptr parse_seq(reader &r, char end, int sl, int sc)
        {
            std::vector<node_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                r.fail("unterminated collection");
            node_ptr out = end == ')' ? make_node(list{std::move(elems)}) : make_node(vector_t{std::move(elems)});
            attach_pos(*out, sl, sc);
            return out;
        }

        inline node_ptr parse_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get();
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"') { closed = true; break; }
                if (c != '\\') { out += c; continue; }
                if (r.eof())
                    r.fail("bad escape");
                char e = r.get();
                switch (e)
                {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                default: out += e; break;
                }
            }
            if (!closed)
                r.fail("unterminated string");
            auto n = make_node(out);
            attach_pos(*n, sl, sc);
            return n;
        }

        inline node_ptr parse_number(reader &r)
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
            node_ptr n;
            try
            {
                n = is_float ? make_node(std::stod(num)) : make_node((int64_t)std::stoll(num));
            }
            catch (const std::logic_error &)
            {
                r.fail("invalid number '" + num + "'");
            }
            attach_pos(*n, sl, sc);
            return n;
        }

        inline node_ptr parse_atom(reader &r)
        {
            int sl = r.line, sc = r.col;
            bool kw = false;
            if (r.peek() == ':') { kw = true; r.get(); }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            node_ptr n;
            if (kw) n = make_node(keyword{s});
            else if (s == "nil") n = make_node(std::monostate{});
            else if (s == "true") n = make_node(true);
            else if (s == "false") n = make_node(false);
            else n = make_node(symbol{s});
            attach_pos(*n, sl, sc);
            return n;
        }

        inline node_ptr parse_value(reader &r)
        {
            r.skip_ws();
            char c = r.peek();
            if (c == '"')
                return parse_string(r);
            if (c == '(' || c == '[')
            {
                int sl = r.line, sc = r.col;
                r.get();
                return parse_seq(r, c == '(' ? ')' : ']', sl, sc);
            }
            if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
                return parse_number(r);
            if (c == ':' || is_symbol_start(c))
                return parse_atom(r);
            if (r.eof())
                r.fail("unexpected end of input");
            r.fail(std::string("unexpected character '") + c + "'");
        }
    } // namespace detail

    inline node_ptr parse(std::string_view input)
    {
        detail::reader r(input);
        auto v = detail::parse_value(r);
        r.skip_ws();
        if (!r.eof())
            r.fail("unexpected trailing characters");
        return v;
    }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return to_string(*p); }
    inline std::string to_string(const node &n)
    {
        struct V
        {
            std::string seq(const std::vector<node_ptr> &xs, char o, char c) const
            {
                std::string out(1, o);
                for (size_t i = 0; i < xs.size(); ++i)
                {
                    if (i) out += ' ';
                    out += to_string(xs[i]);
                }
                return out + c;
            }
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const { std::ostringstream oss; oss << d; return oss.str(); }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string operator()(const list &l) const { return seq(l.elems, '(', ')'); }
            std::string operator()(const vector_t &v) const { return seq(v.elems, '[', ']'); }
        };
        return std::visit(V{}, n.data);
    }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end() || !it->second)
            return def;
        if (auto p = std::get_if<int64_t>(&it->second->data))
            return (int)*p;
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    // head symbol of a list form, empty if none
    inline std::string head_of(const node &n)
    {
        auto l = as_list(n);
        if (!l || l->elems.empty())
            return {};
        auto s = as_symbol(*l->elems[0]);
        return s ? s->name : std::string{};
    }
    // value following :key inside a list form
    inline node_ptr kw_arg(const list &l, const std::string &key)
    {
        for (size_t i = 0; i + 1 < l.elems.size(); ++i)
            if (is_keyword(*l.elems[i]) && std::get<keyword>(l.elems[i]->data).name == key)
                return l.elems[i + 1];
        return nullptr;
    }
    // symbol name, or string contents for forms that accept either
    inline std::string name_of(const node_ptr &n)
    {
        if (!n)
            return {};
        if (auto s = as_symbol(*n))
            return s->name;
        if (auto str = std::get_if<std::string>(&n->data))
            return *str;
        return {};
    }

    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr node_list(std::initializer_list<node_ptr> xs) { return detail::make_node(list{std::vector<node_ptr>(xs)}); }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs) { return detail::make_node(vector_t{std::vector<node_ptr>(xs)}); }

} // namespace tagc
