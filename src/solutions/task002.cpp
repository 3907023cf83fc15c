#include "solution_registry.h"
namespace{using gridscore::matrix_t;
void f(matrix_t&r,int i,int j){if(i<0||j<0||i>=(int)r.size()||j>=(int)r[i].size()||r[i][j])return;
r[i][j]=4;f(r,i+1,j);f(r,i-1,j);f(r,i,j+1);f(r,i,j-1);}
matrix_t p(const matrix_t&g){matrix_t r=g;int h=r.size(),w=r.at(0).size();
for(int i=0;i<h;i++)for(int j=0;j<w;j++)if(!i||!j||i==h-1||j==w-1)f(r,i,j);
for(int i=0;i<h;i++)for(int j=0;j<w;j++)r[i][j]=r[i][j]==4?0:r[i][j]?r[i][j]:4;return r;}}
GRIDSCORE_REGISTER_SOLUTION(2,p);
