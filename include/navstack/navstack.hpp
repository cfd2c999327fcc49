/*
 * navstack - Navigation back stack
 *
 * ============================================================================
 * WHAT IS NAVSTACK?
 * ============================================================================
 *
 * A navigation controller needs history: where the user is, and where "back"
 * leads. navstack keeps that history as a stack of records.
 *
 *   Navigator::go_to(d)      -->  BackStack::push(d)      (new top)
 *   Navigator::pop()         -->  BackStack::pop()        (never the root)
 *   Navigator::pop_to(d)     -->  BackStack::pop_until(record shows d)
 *   Navigator::reset_root(d) -->  drain, then push(d)
 *
 * The renderer reads top_record() to decide what to show, and subscribes to
 * change notifications to learn when to show it again.
 *
 * ============================================================================
 * QUICK START
 * ============================================================================
 *
 *      #include <navstack/navstack.hpp>
 *
 *      navstack::ScreenBackStack stack;
 *      navstack::Navigator<navstack::Screen> nav(stack);
 *
 *      stack.subscribe([](const auto& s, const navstack::StackChange& change) {
 *          render(s.top_record()->destination());
 *      });
 *
 *      nav.go_to(navstack::Screen("home"));
 *      nav.go_to(navstack::Screen("details", {{"id", "42"}}));
 *      nav.pop();
 *
 * ============================================================================
 * KEY TYPES
 * ============================================================================
 *
 *   BasicRecord<D>  - key + destination, immutable        (record.hpp)
 *   BackStack<R>    - LIFO history of records             (back_stack.hpp)
 *   Navigator<D>    - navigation intents over a BackStack (navigator.hpp)
 *   Screen          - named destination with parameters   (screen.hpp)
 *   WarningCollector- key audit and navigation warnings   (warnings.hpp)
 *   Config          - navstack.json settings              (config.hpp)
 */

#ifndef NAVSTACK_NAVSTACK_HPP
#define NAVSTACK_NAVSTACK_HPP

#include "navstack/back_stack.hpp"
#include "navstack/config.hpp"
#include "navstack/json.hpp"
#include "navstack/navigator.hpp"
#include "navstack/record.hpp"
#include "navstack/screen.hpp"
#include "navstack/types.hpp"
#include "navstack/warnings.hpp"

#endif // NAVSTACK_NAVSTACK_HPP
