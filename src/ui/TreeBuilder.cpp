#include "ui/TreeBuilder.hpp"
#include <algorithm>

using tally::model::NodeIndex;
using tally::model::OptionalIndex;
using tally::model::TreeLinks;

namespace tally::ui {

void build_tree_links(model::FrameSnapshot& snapshot) {
  const size_t len = snapshot.len;
  std::fill_n(snapshot.links.begin(), len, TreeLinks{});

  // Head insertion while walking backwards leaves every child list in
  // ascending index order without a second pass.
  for (size_t n = len; n-- > 1;) {
    const OptionalIndex parent = snapshot.nodes[n].parent.parent();
    if (!parent.has_value() || parent.value().get() >= len) continue;
    auto& parent_links = snapshot.links[parent.value().get()];
    snapshot.links[n].next_sibling = parent_links.first_child;
    parent_links.first_child = NodeIndex(n);
  }
}

} // namespace tally::ui
