#include <lifecycle-core/assert.hh>
#include <lifecycle-core/error.hh>
#include <lifecycle-core/native.hh>
#include <lifecycle-core/utility.hh>

struct lc::error::payload
{
    std::string message;
    lc::source_location site;
    std::exception_ptr cause;
    std::vector<std::exception_ptr> suppressed;

    payload(std::string msg, lc::source_location s, std::exception_ptr c)
      : message(lc::move(msg)), site(s), cause(lc::move(c))
    {
    }
};

namespace
{
// returns the lc::error held by failure, nullptr if it holds something else
// the pointer stays valid as long as failure is alive
lc::error const* try_get_error(std::exception_ptr const& failure)
{
    if (!failure)
        return nullptr;

    try
    {
        std::rethrow_exception(failure);
    }
    catch (lc::error const& e)
    {
        return &e;
    }
    catch (...)
    {
        return nullptr;
    }
}

void append_indent(std::string& out, int indent)
{
    out.append(size_t(indent) * 2, ' ');
}

void append_site(std::string& out, lc::source_location const& s)
{
    out += s.file_name();
    out += ":";
    out += std::to_string(s.line());
    out += " - ";
    out += s.function_name();
}

void append_report(std::string& out, lc::error const& e, int indent);

// a related failure (cause or suppressed) is either a nested report or a single description line
void append_related(std::string& out, char const* label, std::exception_ptr const& failure, int indent)
{
    append_indent(out, indent);
    out += label;
    out += ": ";

    if (auto const* nested = try_get_error(failure))
    {
        out += "\n";
        append_report(out, *nested, indent + 1);
    }
    else
    {
        out += lc::describe(failure);
        out += "\n";
    }
}

void append_report(std::string& out, lc::error const& e, int indent)
{
    append_indent(out, indent);
    out += "error: ";
    out += e.message();
    out += "\n";

    append_indent(out, indent);
    out += "  at ";
    append_site(out, e.site());
    out += "\n";

    if (e.has_cause())
        append_related(out, "  cause", e.cause(), indent);

    for (auto const& s : e.suppressed())
        append_related(out, "  suppressed", s, indent);
}
} // namespace

lc::error::error(std::string message, lc::source_location site)
  : _payload(std::make_shared<payload>(lc::move(message), site, nullptr))
{
}

lc::error::error(std::exception_ptr cause, std::string message, lc::source_location site)
  : _payload(std::make_shared<payload>(lc::move(message), site, lc::move(cause)))
{
}

char const* lc::error::what() const noexcept
{
    return _payload->message.c_str();
}

std::string const& lc::error::message() const
{
    return _payload->message;
}

lc::source_location lc::error::site() const
{
    return _payload->site;
}

std::exception_ptr const& lc::error::cause() const
{
    return _payload->cause;
}

bool lc::error::has_cause() const
{
    return _payload->cause != nullptr;
}

std::vector<std::exception_ptr> const& lc::error::suppressed() const
{
    return _payload->suppressed;
}

void lc::error::add_suppressed(std::exception_ptr failure)
{
    LC_ASSERT(failure != nullptr, "cannot suppress an empty exception_ptr");
    _payload->suppressed.push_back(lc::move(failure));
}

std::string lc::error::to_string() const
{
    std::string result;
    append_report(result, *this, 0);
    return result;
}

lc::teardown_double_error::teardown_double_error(std::exception_ptr outer, std::exception_ptr inner, lc::source_location site)
  : lc::error("Double exception while tearing down composite resource: " + lc::describe(outer) + ", " + lc::describe(inner),
              [&]
              {
                  // report where the outer failure was raised if it knows
                  auto const* outer_error = try_get_error(outer);
                  return outer_error != nullptr ? outer_error->site() : site;
              }()),
    _outer(lc::move(outer)),
    _inner(lc::move(inner))
{
}

std::string lc::describe(std::exception_ptr const& failure)
{
    if (!failure)
        return "<no exception>";

    try
    {
        std::rethrow_exception(failure);
    }
    catch (std::exception const& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "<" + lc::current_exception_type_name() + ">";
    }
}

std::exception_ptr lc::with_suppressed(std::exception_ptr primary, std::exception_ptr secondary, lc::source_location site)
{
    LC_ASSERT(primary != nullptr, "primary failure must not be empty");
    LC_ASSERT(secondary != nullptr, "suppressed failure must not be empty");

    try
    {
        std::rethrow_exception(primary);
    }
    catch (lc::error& e)
    {
        e.add_suppressed(lc::move(secondary));
        return primary;
    }
    catch (...)
    {
        auto wrapped = lc::error(primary, lc::describe(primary), site);
        wrapped.add_suppressed(lc::move(secondary));
        return std::make_exception_ptr(lc::move(wrapped));
    }
}

std::vector<std::exception_ptr> lc::suppressed_of(std::exception_ptr const& failure)
{
    if (auto const* e = try_get_error(failure))
        return e->suppressed();
    return {};
}
