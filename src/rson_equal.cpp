// Structural equality over value trees.
#include "rson/rson.hpp"

namespace rson {

static bool same_number(const number& a, const number& b){
	if(a.integral && b.integral) return a.integer == b.integer;
	return a.value == b.value;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_comments) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	if (!ignore_comments) {
		if (a->comments != b->comments) return false;
		if (a->trailing_comments != b->trailing_comments) return false;
	}

	struct Visitor {
		const node_ptr& a; const node_ptr& b; bool ignore_comments;
		static bool cmp(const node_ptr& x, const node_ptr& y, bool ig) { return equal_impl(x, y, ig); }
		bool operator()(std::monostate) const { return true; }
		bool operator()(bool) const { return std::get<bool>(a->data) == std::get<bool>(b->data); }
		bool operator()(const number&) const { return same_number(std::get<number>(a->data), std::get<number>(b->data)); }
		bool operator()(const std::string&) const { return std::get<std::string>(a->data) == std::get<std::string>(b->data); }
		bool operator()(const sequence&) const {
			const auto& le = std::get<sequence>(a->data).elems;
			const auto& re = std::get<sequence>(b->data).elems;
			if (le.size() != re.size()) return false;
			for (size_t i = 0; i < le.size(); ++i) if (!cmp(le[i], re[i], ignore_comments)) return false;
			return true;
		}
		// Pair order is significant.
		bool operator()(const mapping&) const {
			const auto& lm = std::get<mapping>(a->data).entries;
			const auto& rm = std::get<mapping>(b->data).entries;
			if (lm.size() != rm.size()) return false;
			for (size_t i = 0; i < lm.size(); ++i) {
				if (!cmp(lm[i].first, rm[i].first, ignore_comments)) return false;
				if (!cmp(lm[i].second, rm[i].second, ignore_comments)) return false;
			}
			return true;
		}
		bool operator()(const tagged&) const {
			const auto& lt = std::get<tagged>(a->data);
			const auto& rt = std::get<tagged>(b->data);
			return lt.name == rt.name && cmp(lt.body, rt.body, ignore_comments);
		}
	};

	return std::visit(Visitor{a, b, ignore_comments}, a->data);
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_comments) { return equal_impl(a, b, ignore_comments); }

} // namespace rson
