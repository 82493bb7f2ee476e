#include "paramdec/suggest.hpp"
#include <algorithm>

namespace paramdec {

int edit_distance(std::string_view a, std::string_view b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap the table; positional mismatch count is close enough for long names
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist;
        return dist + (int)std::max(n,m) - (int)std::min(n,m);
    }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){
        for(size_t j=1;j<=m;++j){
            int c = a[i-1]==b[j-1]?0:1;
            dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c});
        }
    }
    return dp[n][m];
}

std::vector<std::string> fuzzy_candidates(std::string_view target, const std::vector<std::string>& pool, int max_dist){
    std::vector<std::string> out;
    for(auto& c : pool){
        if(c.empty()) continue;
        if(edit_distance(target, c) <= max_dist) out.push_back(c);
        if(out.size() == 5) break;
    }
    return out;
}

} // namespace paramdec
